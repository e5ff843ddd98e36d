#ifndef CONVERTWORKER_HPP
#define CONVERTWORKER_HPP

#include <QMetaType>
#include <QThread>
#include <QString>
#include "types.hpp"
#include "cancellation.hpp"

Q_DECLARE_METATYPE(vid2mp3::ProgressEvent)
Q_DECLARE_METATYPE(vid2mp3::FileResult)
Q_DECLARE_METATYPE(vid2mp3::JobFinished)

// Runs one batch on its own thread. Signals reach the GUI through queued
// connections, so they arrive in emission order on the GUI thread.
class ConvertWorker : public QThread {
    Q_OBJECT
public:
    ConvertWorker(const vid2mp3::ConversionJob& job,
                  vid2mp3::CancellationFlag cancel,
                  QObject* parent = nullptr);

signals:
    void progressChanged(const vid2mp3::ProgressEvent& event);
    void fileFinished(const vid2mp3::FileResult& result);
    void logMessage(const QString& message);
    void jobFinished(const vid2mp3::JobFinished& finished);

protected:
    void run() override;

private:
    vid2mp3::ConversionJob job_;
    vid2mp3::CancellationFlag cancel_;
};

#endif
