#pragma once

#include <ostream>

#include <QMetaType>
#include <QString>

// Device could not be found or opened. Nothing was started.
struct DeviceError {
    QString reason;
};

// The capture failed after it started, or produced nothing.
struct CaptureError {
    QString reason;
};

struct TranscriptionFailure {
    enum class Kind {
        ModelLoad,
        Transcription,
        Cancelled,
        Rejected
    };

    Kind kind{Kind::Transcription};
    QString reason;
};

std::ostream& operator << (std::ostream& os, TranscriptionFailure::Kind kind);
std::ostream& operator << (std::ostream& os, const TranscriptionFailure& f);

void registerErrorMetaTypes();

Q_DECLARE_METATYPE(DeviceError)
Q_DECLARE_METATYPE(CaptureError)
Q_DECLARE_METATYPE(TranscriptionFailure)
