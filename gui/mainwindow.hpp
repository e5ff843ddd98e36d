#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <QMainWindow>
#include <memory>
#include "types.hpp"
#include "cancellation.hpp"
#include "orchestrator.hpp"

class QComboBox;
class QLabel;
class QListWidget;
class QPushButton;
class QTextEdit;
class QProgressBar;
class QCloseEvent;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

signals:
    // Emitted from startBatch(); the receiver must start a worker for the job
    void conversionRequested(const vid2mp3::ConversionJob& job,
                             vid2mp3::CancellationFlag cancel);

public slots:
    void onProgressChanged(const vid2mp3::ProgressEvent& event);
    void onFileFinished(const vid2mp3::FileResult& result);
    void onLogMessage(const QString& message);
    void onJobFinished(const vid2mp3::JobFinished& finished);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void addFiles();
    void clearFiles();
    void selectOutputDirectory();
    void startConversion();
    void cancelConversion();

private:
    void setupUi();
    void refreshFileList();
    void updateControls();
    void appendLog(const QString& message, const QString& color = QString());

    std::unique_ptr<vid2mp3::Orchestrator> m_orchestrator;
    bool m_closePending = false;

    // Input widgets
    QListWidget* m_fileList;
    QPushButton* m_addFilesBtn;
    QPushButton* m_clearFilesBtn;

    // Output widgets
    QLabel* m_outputLabel;
    QPushButton* m_selectOutputBtn;
    QComboBox* m_bitrateCombo;

    // Progress and log widgets
    QProgressBar* m_progressBar;
    QPushButton* m_convertBtn;
    QPushButton* m_cancelBtn;
    QTextEdit* m_logEdit;
};

#endif // MAINWINDOW_HPP
