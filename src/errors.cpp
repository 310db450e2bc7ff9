#include "errors.hpp"

namespace forge {

const char* connection_error_kind_name(ConnectionErrorKind kind) {
    switch (kind) {
        case ConnectionErrorKind::Refused: return "refused";
        case ConnectionErrorKind::Timeout: return "timeout";
        case ConnectionErrorKind::Reset:   return "reset";
        case ConnectionErrorKind::Dns:     return "dns";
        case ConnectionErrorKind::Closed:  return "closed";
        case ConnectionErrorKind::Io:      return "io";
    }
    return "unknown";
}

const char* protocol_error_kind_name(ProtocolErrorKind kind) {
    switch (kind) {
        case ProtocolErrorKind::InvalidRequest:      return "invalid request";
        case ProtocolErrorKind::MalformedStatusLine: return "malformed status line";
        case ProtocolErrorKind::InvalidHeader:       return "invalid header";
        case ProtocolErrorKind::HeaderTooLarge:      return "header too large";
        case ProtocolErrorKind::BadChunkSize:        return "bad chunk size";
        case ProtocolErrorKind::MalformedChunk:      return "malformed chunk";
        case ProtocolErrorKind::TruncatedBody:       return "truncated body";
        case ProtocolErrorKind::TrailingData:        return "trailing data";
        case ProtocolErrorKind::TruncatedJson:       return "truncated json";
    }
    return "unknown";
}

const char* json_error_kind_name(JsonErrorKind kind) {
    switch (kind) {
        case JsonErrorKind::UnexpectedEnd:      return "unexpected end of input";
        case JsonErrorKind::UnexpectedToken:    return "unexpected token";
        case JsonErrorKind::UnterminatedString: return "unterminated string";
        case JsonErrorKind::InvalidEscape:      return "invalid escape";
        case JsonErrorKind::InvalidNumber:      return "invalid number";
        case JsonErrorKind::DepthExceeded:      return "depth exceeded";
        case JsonErrorKind::TrailingData:       return "trailing data";
    }
    return "unknown";
}

} // namespace forge
