#pragma once

#include <string>
#include <variant>

// Remote stdout bytes, in arrival order.
struct DataEvent {
    std::string bytes;
};

// Extended data (stream 1 is stderr).
struct ExtendedDataEvent {
    int stream_id = 1;
    std::string bytes;
};

// Remote side will send no more data.
struct EofEvent {};

// Remote command exited. Data may still follow.
struct ExitStatusEvent {
    int code = 0;
};

// Remote command was killed by a signal; no exit status follows.
struct ExitSignalEvent {
    std::string signal;
    std::string message;
    bool core_dumped = false;
};

// The channel stopped producing events for a transport reason (socket error,
// inactivity timeout). The stream ends right after this event.
struct ChannelLostEvent {
    std::string reason;
};

using ChannelEvent = std::variant<DataEvent,
                                  ExtendedDataEvent,
                                  EofEvent,
                                  ExitStatusEvent,
                                  ExitSignalEvent,
                                  ChannelLostEvent>;

// Overload set for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
