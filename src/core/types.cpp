#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:                return "none";
    case ErrorKind::Credential:          return "credential error";
    case ErrorKind::Handshake:           return "handshake error";
    case ErrorKind::Timeout:             return "timeout";
    case ErrorKind::Authentication:      return "authentication error";
    case ErrorKind::Channel:             return "channel error";
    case ErrorKind::ProtocolConsistency: return "protocol consistency error";
    case ErrorKind::LocalIO:             return "local I/O error";
    case ErrorKind::SessionState:        return "session state error";
    case ErrorKind::Config:              return "config error";
    case ErrorKind::Other:               return "error";
    }
    return "error";
}
