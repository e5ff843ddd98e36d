#include <QApplication>
#include "mainwindow.hpp"
#include "convertworker.hpp"
#include "types.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("vid2mp3 Converter");

    qRegisterMetaType<vid2mp3::ProgressEvent>("vid2mp3::ProgressEvent");
    qRegisterMetaType<vid2mp3::FileResult>("vid2mp3::FileResult");
    qRegisterMetaType<vid2mp3::JobFinished>("vid2mp3::JobFinished");

    MainWindow window;

    QObject::connect(&window, &MainWindow::conversionRequested,
        [&window](const vid2mp3::ConversionJob& job, vid2mp3::CancellationFlag cancel) {
            auto* worker = new ConvertWorker(job, cancel, &window);

            QObject::connect(worker, &ConvertWorker::progressChanged,
                           &window, &MainWindow::onProgressChanged);
            QObject::connect(worker, &ConvertWorker::fileFinished,
                           &window, &MainWindow::onFileFinished);
            QObject::connect(worker, &ConvertWorker::logMessage,
                           &window, &MainWindow::onLogMessage);
            QObject::connect(worker, &ConvertWorker::jobFinished,
                           &window, &MainWindow::onJobFinished);

            // Clean up worker when done - wait for thread to finish first
            QObject::connect(worker, &ConvertWorker::jobFinished, worker,
                           [worker](const vid2mp3::JobFinished&) {
                               worker->wait();
                               worker->deleteLater();
                           });

            worker->start();
        });

    window.show();
    return app.exec();
}
