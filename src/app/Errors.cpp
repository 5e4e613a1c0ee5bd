#include <array>
#include <mutex>
#include <string_view>

#include "Errors.h"
#include "AudioTypes.h"

using namespace std;

ostream& operator << (ostream& os, TranscriptionFailure::Kind kind) {
    constexpr auto kinds = to_array<string_view>({
        "ModelLoad",
        "Transcription",
        "Cancelled",
        "Rejected"
    });

    return os << kinds.at(static_cast<size_t>(kind));
}

ostream& operator << (ostream& os, const TranscriptionFailure& f) {
    return os << f.kind << ": " << f.reason.toStdString();
}

void registerErrorMetaTypes()
{
    static once_flag registered;
    call_once(registered, [] {
        qRegisterMetaType<DeviceError>();
        qRegisterMetaType<CaptureError>();
        qRegisterMetaType<TranscriptionFailure>();
        qRegisterMetaType<VolumeSample>();
    });
}
