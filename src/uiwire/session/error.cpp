#include "uiwire/session/error.hpp"


namespace uiwire {

std::ostream& operator<<(std::ostream& os, const TakeDataError& e) {
    switch (e.code) {
        case TakeDataError::Code::DifferingEventPaths:
            os << "this event path is different from the incoming event path; "
               << "application should always validate the event path before taking the event data; "
               << "this event path: " << to_string(e.existing)
               << "; incoming event path: " << to_string(e.incoming);
            break;
        case TakeDataError::Code::DataAlreadyTaken:
            os << "tried to take event data, but it was already taken; "
               << "this is probably caused by calling take_data more than once while handling a single event";
            break;
        case TakeDataError::Code::FailedToDeserialize:
            os << "failed to deserialize event data according to the pre-specified type; " << e.message;
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const MountError& e) {
    switch (e.code) {
        case MountError::Code::EmptyEventPath:
            os << "found an empty path when trying to check for a mount event, which is never valid";
            break;
        case MountError::Code::NoEventData:
            os << "event key stated that this is a mount event, but no event data was given, which is not valid";
            break;
        case MountError::Code::FailedToDeserializeMountData:
            os << "event key stated that this is a mount event, but the event data didn't deserialize "
               << "into the expected mount data structure; " << e.message;
            break;
        case MountError::Code::ClientActive:
            os << "cannot take the mount event while a client holds this session root";
            break;
    }
    return os;
}

} // namespace uiwire
