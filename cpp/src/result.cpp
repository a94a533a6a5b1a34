#include "stegbridge/result.hpp"

namespace stegbridge {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoFilePart:
            return "NoFilePart";
        case ErrorKind::NoFileSelected:
            return "NoFileSelected";
        case ErrorKind::FileTypeNotAllowed:
            return "FileTypeNotAllowed";
        case ErrorKind::NoImageData:
            return "NoImageData";
        case ErrorKind::DecodeError:
            return "DecodeError";
        case ErrorKind::EncodeError:
            return "EncodeError";
        case ErrorKind::ProcessingError:
            return "ProcessingError";
    }
    return "ProcessingError";
}

int HttpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoFilePart:
        case ErrorKind::NoFileSelected:
        case ErrorKind::FileTypeNotAllowed:
        case ErrorKind::NoImageData:
            return 400;
        case ErrorKind::DecodeError:
        case ErrorKind::EncodeError:
        case ErrorKind::ProcessingError:
            return 500;
    }
    return 500;
}

}  // namespace stegbridge
