#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "telexpect/net/byte_stream.h"

namespace telexpect::tests {

// Everything a ScriptedStream does, kept alive after the stream itself is
// handed to a Session.
struct ScriptState {
    struct Reaction {
        std::string trigger;   // fires once the written bytes contain this
        std::string response;  // queued for reading when fired
    };

    std::deque<std::uint8_t> incoming;
    std::vector<Reaction> reactions; // consumed in order
    std::size_t nextReaction{0};
    std::size_t scanPos{0}; // written bytes before this already fired a reaction

    std::string written;
    std::size_t writeCalls{0};
    std::size_t closeCalls{0};
    bool open{true};
    bool failWrites{false};

    // Virtual clock
    std::uint64_t now{0};
    std::uint64_t msPerByte{0};

    // Report real elapsed time instead of the virtual clock.
    bool wallClock{false};
    std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

    // Bytes that become readable once the virtual clock reaches `at`.
    struct Scheduled {
        std::uint64_t at;
        std::string bytes;
    };
    std::deque<Scheduled> scheduled;

    // When incoming is empty: return Closed instead of TimedOut.
    bool closeWhenDrained{false};

    // When incoming is empty and dripByte is set, deliver it every dripMs.
    bool drip{false};
    std::uint8_t dripByte{'.'};
    std::uint64_t dripMs{10};

    std::vector<int> readTimeouts;

    void feed(std::string_view s)
    {
        incoming.insert(incoming.end(), s.begin(), s.end());
    }

    void feed_bytes(std::initializer_list<std::uint8_t> bytes)
    {
        incoming.insert(incoming.end(), bytes.begin(), bytes.end());
    }

    void feed_at(std::uint64_t at, std::string bytes)
    {
        scheduled.push_back({at, std::move(bytes)});
    }

    void release_due()
    {
        while (!scheduled.empty() && scheduled.front().at <= now) {
            feed(scheduled.front().bytes);
            scheduled.pop_front();
        }
    }

    std::uint64_t clock_ms() const
    {
        if (!wallClock) return now;
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    }

    void on_write(std::string trigger, std::string response)
    {
        reactions.push_back({std::move(trigger), std::move(response)});
    }

    void check_reactions()
    {
        while (nextReaction < reactions.size()) {
            const auto& r = reactions[nextReaction];
            const auto pos = written.find(r.trigger, scanPos);
            if (pos == std::string::npos) break;
            feed(r.response);
            scanPos = pos + r.trigger.size();
            ++nextReaction;
        }
    }
};

class ScriptedStream final : public telexpect::net::IByteStream {
public:
    explicit ScriptedStream(std::shared_ptr<ScriptState> state)
        : _s(std::move(state))
    {
    }

    bool is_open() const noexcept override { return _s->open; }

    telexpect::net::ReadResult read_byte(std::uint8_t& out, int timeout_ms) override
    {
        _s->readTimeouts.push_back(timeout_ms);
        if (!_s->open) {
            return telexpect::net::ReadResult::Closed;
        }
        _s->release_due();
        if (_s->incoming.empty()) {
            if (_s->drip) {
                _s->now += _s->dripMs;
                out = _s->dripByte;
                return telexpect::net::ReadResult::Byte;
            }
            if (_s->closeWhenDrained && _s->scheduled.empty()) {
                return telexpect::net::ReadResult::Closed;
            }
            _s->now += static_cast<std::uint64_t>(timeout_ms);
            return telexpect::net::ReadResult::TimedOut;
        }
        out = _s->incoming.front();
        _s->incoming.pop_front();
        _s->now += _s->msPerByte;
        return telexpect::net::ReadResult::Byte;
    }

    Status write_all(const std::uint8_t* data, std::size_t len) override
    {
        ++_s->writeCalls;
        if (!_s->open) return Status::NotConnected;
        if (_s->failWrites) return Status::TransportError;
        _s->written.append(reinterpret_cast<const char*>(data), len);
        _s->check_reactions();
        return Status::Ok;
    }

    Status close() override
    {
        ++_s->closeCalls;
        _s->open = false;
        return Status::Ok;
    }

    std::uint64_t now_ms() override { return _s->clock_ms(); }

private:
    std::shared_ptr<ScriptState> _s;
};

inline std::unique_ptr<ScriptedStream> make_stream(const std::shared_ptr<ScriptState>& state)
{
    return std::make_unique<ScriptedStream>(state);
}

} // namespace telexpect::tests
