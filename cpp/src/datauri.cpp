#include "stegbridge/datauri.hpp"

#include "stegbridge/base64.hpp"

namespace stegbridge::datauri {

std::string ToBase64(const Bytes& data) {
    return base64::Encode(data);
}

std::string ToDataUri(const Bytes& data, const std::string& mime_type) {
    return WithPrefix(base64::Encode(data), mime_type);
}

std::string WithPrefix(const std::string& base64_text, const std::string& mime_type) {
    return "data:" + mime_type + ";base64," + base64_text;
}

std::string PayloadOf(const std::string& framed) {
    std::size_t comma = framed.find(',');
    if (comma == std::string::npos) {
        return framed;
    }
    return framed.substr(comma + 1);
}

Result<Bytes> FromFramed(const std::string& framed) {
    bool ok = false;
    std::string reason;
    Bytes decoded = base64::Decode(PayloadOf(framed), &ok, &reason);
    if (!ok) {
        return MakeError(ErrorKind::DecodeError, reason);
    }
    return decoded;
}

}  // namespace stegbridge::datauri
