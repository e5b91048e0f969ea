#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace relaylb {

enum class ConnectionState {
    Connected,
    InRoom,
    Terminated
};

// One client socket as seen by the room registry and the liveness sweep.
// Transport specifics live in subclasses.
class ConnectionHandle {
public:
    ConnectionHandle(uint64_t id, std::string remote_address)
        : id_(id), remote_address_(std::move(remote_address)),
          last_pong_(std::chrono::steady_clock::now()) {}

    virtual ~ConnectionHandle() = default;

    ConnectionHandle(const ConnectionHandle&) = delete;
    ConnectionHandle& operator=(const ConnectionHandle&) = delete;

    // Queue a text frame; frames go out in the order they were queued
    virtual void send(std::string frame) = 0;
    virtual void ping() = 0;
    // Drop the socket without a closing handshake
    virtual void terminate() = 0;
    // Closing handshake
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    uint64_t id() const { return id_; }
    const std::string& remote_address() const { return remote_address_; }

    const std::optional<std::string>& room_id() const { return room_id_; }
    bool is_initiator() const { return is_initiator_; }

    void assign_room(std::string room_id, bool initiator) {
        room_id_ = std::move(room_id);
        is_initiator_ = initiator;
    }

    void clear_room() {
        room_id_.reset();
        is_initiator_ = false;
    }

    bool is_alive() const { return is_alive_; }
    void set_alive(bool alive) { is_alive_ = alive; }

    void on_pong() {
        is_alive_ = true;
        last_pong_ = std::chrono::steady_clock::now();
    }

    std::chrono::steady_clock::time_point last_pong() const { return last_pong_; }

    void mark_terminated() { terminated_ = true; }

    ConnectionState state() const {
        if (terminated_) return ConnectionState::Terminated;
        return room_id_ ? ConnectionState::InRoom : ConnectionState::Connected;
    }

private:
    uint64_t id_;
    std::string remote_address_;
    std::optional<std::string> room_id_;
    bool is_initiator_ = false;
    bool is_alive_ = true;
    bool terminated_ = false;
    std::chrono::steady_clock::time_point last_pong_;
};

} // namespace relaylb
