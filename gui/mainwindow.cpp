#include "mainwindow.hpp"
#include "errors.hpp"

#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QScrollBar>
#include <QSplitter>
#include <QStringList>
#include <QTextEdit>
#include <QTime>
#include <QVBoxLayout>

#include <string>
#include <vector>

namespace {

QString dialogTitle(vid2mp3::ErrorKind kind) {
    switch (kind) {
        case vid2mp3::ErrorKind::InvalidDirectory:  return "Invalid Directory";
        case vid2mp3::ErrorKind::EmptyInputList:    return "No Files";
        case vid2mp3::ErrorKind::NoOutputDirectory: return "No Output Directory";
        case vid2mp3::ErrorKind::JobRunning:        return "Conversion Running";
        case vid2mp3::ErrorKind::UnrecoverableJob:  return "Conversion Failed";
    }
    return "Error";
}

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent) {
    setWindowTitle("MP4 to MP3 Converter");
    setMinimumSize(800, 600);
    resize(900, 700);

    m_orchestrator = std::make_unique<vid2mp3::Orchestrator>(
        [this](const vid2mp3::ConversionJob& job, vid2mp3::CancellationFlag cancel) {
            emit conversionRequested(job, cancel);
        });
    m_orchestrator->setLogCallback([this](const std::string& msg) {
        appendLog(QString::fromStdString(msg));
    });

    setupUi();
    appendLog("Ready. Please select MP4 files and output directory.");
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    auto* centralWidget = new QWidget(this);
    auto* mainLayout = new QVBoxLayout(centralWidget);
    mainLayout->setContentsMargins(12, 12, 12, 12);
    mainLayout->setSpacing(10);

    auto* titleLabel = new QLabel("MP4 to MP3 Converter");
    QFont titleFont = titleLabel->font();
    titleFont.setPointSize(16);
    titleFont.setBold(true);
    titleLabel->setFont(titleFont);
    titleLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(titleLabel);

    auto* splitter = new QSplitter(Qt::Vertical);
    mainLayout->addWidget(splitter, 1);

    // Input files group
    auto* inputGroup = new QGroupBox("Input Files");
    auto* inputLayout = new QVBoxLayout(inputGroup);
    auto* fileButtonsLayout = new QHBoxLayout();
    m_addFilesBtn = new QPushButton("Add MP4 Files");
    m_clearFilesBtn = new QPushButton("Clear List");
    fileButtonsLayout->addWidget(m_addFilesBtn);
    fileButtonsLayout->addWidget(m_clearFilesBtn);
    fileButtonsLayout->addStretch();
    inputLayout->addLayout(fileButtonsLayout);
    m_fileList = new QListWidget();
    inputLayout->addWidget(m_fileList);
    splitter->addWidget(inputGroup);

    // Output directory group
    auto* outputGroup = new QGroupBox("Output Directory");
    auto* outputLayout = new QHBoxLayout(outputGroup);
    m_selectOutputBtn = new QPushButton("Select Output Directory");
    outputLayout->addWidget(m_selectOutputBtn);
    m_outputLabel = new QLabel("No directory selected");
    outputLayout->addWidget(m_outputLabel, 1);
    outputLayout->addWidget(new QLabel("Bitrate:"));
    m_bitrateCombo = new QComboBox();
    for (int kbps : {96, 128, 192, 256, 320}) {
        m_bitrateCombo->addItem(QString("%1 kbps").arg(kbps), kbps);
    }
    m_bitrateCombo->setCurrentIndex(m_bitrateCombo->findData(128));
    outputLayout->addWidget(m_bitrateCombo);
    splitter->addWidget(outputGroup);

    // Progress group
    auto* progressGroup = new QGroupBox("Conversion Progress");
    auto* progressLayout = new QVBoxLayout(progressGroup);
    m_progressBar = new QProgressBar();
    m_progressBar->setRange(0, 100);
    m_progressBar->setValue(0);
    m_progressBar->setTextVisible(true);
    m_progressBar->setVisible(false);
    progressLayout->addWidget(m_progressBar);

    auto* controlLayout = new QHBoxLayout();
    m_convertBtn = new QPushButton("Start Conversion");
    m_convertBtn->setMinimumWidth(120);
    m_cancelBtn = new QPushButton("Cancel");
    controlLayout->addWidget(m_convertBtn);
    controlLayout->addWidget(m_cancelBtn);
    controlLayout->addStretch();
    progressLayout->addLayout(controlLayout);
    splitter->addWidget(progressGroup);

    // Status log
    auto* statusGroup = new QGroupBox("Status");
    auto* statusLayout = new QVBoxLayout(statusGroup);
    m_logEdit = new QTextEdit();
    m_logEdit->setReadOnly(true);
    m_logEdit->setMinimumHeight(150);
    statusLayout->addWidget(m_logEdit);
    splitter->addWidget(statusGroup);

    splitter->setSizes({150, 80, 120, 200});

    setCentralWidget(centralWidget);

    connect(m_addFilesBtn, &QPushButton::clicked, this, &MainWindow::addFiles);
    connect(m_clearFilesBtn, &QPushButton::clicked, this, &MainWindow::clearFiles);
    connect(m_selectOutputBtn, &QPushButton::clicked, this, &MainWindow::selectOutputDirectory);
    connect(m_convertBtn, &QPushButton::clicked, this, &MainWindow::startConversion);
    connect(m_cancelBtn, &QPushButton::clicked, this, &MainWindow::cancelConversion);

    updateControls();
}

void MainWindow::addFiles() {
    QStringList selected = QFileDialog::getOpenFileNames(
        this,
        "Select MP4 Files",
        QString(),
        "Video Files (*.mp4 *.MP4);;All Files (*)");
    if (selected.isEmpty()) {
        return;
    }

    std::vector<std::string> paths;
    paths.reserve(static_cast<size_t>(selected.size()));
    for (const QString& path : selected) {
        paths.push_back(path.toStdString());
    }

    auto report = m_orchestrator->addFiles(paths);
    refreshFileList();
    updateControls();

    if (!report.rejected.empty()) {
        QStringList lines;
        for (const auto& [path, reason] : report.rejected) {
            lines << QString("%1: %2").arg(QFileInfo(QString::fromStdString(path)).fileName(),
                                           QString::fromStdString(reason));
        }
        QMessageBox::warning(this, "Files Not Added",
                             "Some files were not added:\n\n" + lines.join("\n"));
    }
}

void MainWindow::clearFiles() {
    m_orchestrator->clearFiles();
    refreshFileList();
    updateControls();
}

void MainWindow::selectOutputDirectory() {
    QString dirPath = QFileDialog::getExistingDirectory(
        this,
        "Select Output Directory",
        QString(),
        QFileDialog::ShowDirsOnly | QFileDialog::DontResolveSymlinks);
    if (dirPath.isEmpty()) {
        return;
    }

    try {
        m_orchestrator->setOutputDirectory(dirPath.toStdString());
        m_outputLabel->setText("Output: " + QString::fromStdString(m_orchestrator->outputDirectory()));
    } catch (const vid2mp3::BatchError& e) {
        QMessageBox::warning(this, dialogTitle(e.kind()), QString::fromStdString(e.what()));
    }
    updateControls();
}

void MainWindow::startConversion() {
    vid2mp3::EncoderSettings settings = m_orchestrator->encoderSettings();
    settings.bitrate_kbps = m_bitrateCombo->currentData().toInt();

    try {
        m_orchestrator->setEncoderSettings(settings);
        m_orchestrator->startBatch();
    } catch (const vid2mp3::BatchError& e) {
        QMessageBox::warning(this, dialogTitle(e.kind()), QString::fromStdString(e.what()));
        return;
    }

    m_progressBar->setValue(0);
    m_progressBar->setVisible(true);
    updateControls();
}

void MainWindow::cancelConversion() {
    m_orchestrator->cancel();
    updateControls();
}

void MainWindow::refreshFileList() {
    m_fileList->clear();
    for (const auto& path : m_orchestrator->files()) {
        QString qpath = QString::fromStdString(path);
        auto* item = new QListWidgetItem(QFileInfo(qpath).fileName());
        item->setToolTip(qpath);
        m_fileList->addItem(item);
    }
}

void MainWindow::updateControls() {
    const bool running = m_orchestrator->isRunning();
    m_addFilesBtn->setEnabled(!running);
    m_clearFilesBtn->setEnabled(!running && !m_orchestrator->files().empty());
    m_selectOutputBtn->setEnabled(!running);
    m_bitrateCombo->setEnabled(!running);
    m_convertBtn->setEnabled(m_orchestrator->canStart());
    m_cancelBtn->setEnabled(m_orchestrator->canCancel());
}

void MainWindow::appendLog(const QString& message, const QString& color) {
    QString timestamp = QTime::currentTime().toString("hh:mm:ss");
    if (color.isEmpty()) {
        m_logEdit->append(QString("[%1] %2").arg(timestamp, message.toHtmlEscaped()));
    } else {
        m_logEdit->append(QString("[%1] <span style=\"color: %2;\">%3</span>")
                              .arg(timestamp, color, message.toHtmlEscaped()));
    }
    QScrollBar* scrollbar = m_logEdit->verticalScrollBar();
    scrollbar->setValue(scrollbar->maximum());
}

void MainWindow::onProgressChanged(const vid2mp3::ProgressEvent& event) {
    m_orchestrator->onProgress(event);
    m_progressBar->setValue(m_orchestrator->progressPercent());
}

void MainWindow::onFileFinished(const vid2mp3::FileResult& result) {
    m_orchestrator->onFileResult(result);
}

void MainWindow::onLogMessage(const QString& message) {
    appendLog(message, "gray");
}

void MainWindow::onJobFinished(const vid2mp3::JobFinished& finished) {
    m_orchestrator->onJobFinished(finished);

    m_progressBar->setVisible(false);
    updateControls();

    if (m_closePending) {
        close();
        return;
    }

    QString summary = QString::fromStdString(vid2mp3::format_summary(m_orchestrator->summary()));
    switch (finished.outcome) {
        case vid2mp3::JobOutcome::Completed:
            appendLog("All files have been processed.", "green");
            QMessageBox::information(this, "Conversion Complete",
                                     "All files have been processed.\n\n" + summary);
            break;
        case vid2mp3::JobOutcome::Cancelled:
            appendLog("Conversion cancelled.", "orange");
            QMessageBox::information(this, "Conversion Cancelled",
                                     "The conversion was cancelled.\n\n" + summary);
            break;
        case vid2mp3::JobOutcome::Failed:
            appendLog("Error: " + QString::fromStdString(finished.message), "red");
            QMessageBox::critical(this, "Conversion Failed",
                                  QString::fromStdString(finished.message) + "\n\n" + summary);
            break;
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (!m_orchestrator->isRunning()) {
        event->accept();
        return;
    }

    auto answer = QMessageBox::question(
        this, "Conversion Running",
        "A conversion is still running. Stop after the current file and quit?");
    if (answer == QMessageBox::Yes) {
        m_closePending = true;
        m_orchestrator->cancel();
        updateControls();
    }
    // The window closes from onJobFinished once the worker has stopped
    event->ignore();
}
