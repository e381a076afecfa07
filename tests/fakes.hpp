#pragma once

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <session/clock.hpp>
#include <session/completion_detector.hpp>
#include <session/remote_channel.hpp>
#include <session/stream_source.hpp>

// Virtual time: sleep_for() advances now() instead of blocking.
class FakeClock : public Clock {
public:
    time_point now() const override { return now_; }
    void sleep_for(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) now_ += duration;
        sleeps++;
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now_ - start_);
    }

    int sleeps = 0;

private:
    time_point start_ = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    time_point now_ = start_;
};

// Hands out queued (stdout, stderr) chunks in order. An empty queue makes
// poll() burn its whole timeout on the fake clock.
class ScriptedStreamSource : public StreamSource {
public:
    explicit ScriptedStreamSource(FakeClock& clock) : clock_(clock) {}

    void push(std::string out, std::string err = "") {
        chunks_.push_back({std::move(out), std::move(err)});
    }

    ReadyStreams poll(std::chrono::milliseconds timeout) override {
        polls++;
        if (chunks_.empty()) {
            clock_.sleep_for(timeout);
            return {};
        }
        return {!chunks_.front().first.empty(), !chunks_.front().second.empty()};
    }

    std::string read_out() override {
        if (chunks_.empty()) return "";
        std::string data = std::move(chunks_.front().first);
        chunks_.front().first.clear();
        pop_if_consumed();
        return data;
    }

    std::string read_err() override {
        if (chunks_.empty()) return "";
        std::string data = std::move(chunks_.front().second);
        chunks_.front().second.clear();
        pop_if_consumed();
        return data;
    }

    bool alive() override { return alive_; }

    bool alive_ = true;
    int polls = 0;

private:
    FakeClock& clock_;
    std::deque<std::pair<std::string, std::string>> chunks_;

    void pop_if_consumed() {
        if (chunks_.front().first.empty() && chunks_.front().second.empty()) {
            chunks_.pop_front();
        }
    }
};

// Reports "still running" for the first `busy_checks` calls.
class ScriptedDetector : public CompletionDetector {
public:
    explicit ScriptedDetector(int busy_checks = 0) : busy_checks_(busy_checks) {}

    bool has_exited(const std::string& command, Clock::time_point) override {
        checked.push_back(command);
        if (never_exits) return false;
        return static_cast<int>(checked.size()) > busy_checks_;
    }

    std::vector<std::string> checked;
    bool never_exits = false;

private:
    int busy_checks_;
};

// What a FakeChannel saw; outlives the channel itself
struct ChannelLog {
    std::vector<std::string> sent;
    int closes = 0;
};

// Interactive channel that behaves like a PTY shell: every line sent is
// echoed back followed by its scripted output and then `prompt`, and
// `echo $?` answers with the status of the previous line.
class FakeChannel : public RemoteChannel {
public:
    struct Reply {
        std::string output;
        int status;
    };

    explicit FakeChannel(ChannelLog& log) : log_(log) {}

    bool send(const std::string& data) override {
        if (!send_ok) return false;
        log_.sent.push_back(data);
        if (closed_by_peer) return true;  // nobody left to echo

        std::string line = data;
        if (!line.empty() && line.back() == '\n') line.pop_back();
        pending_ += line + "\r\n";
        if (line == "echo $?") {
            if (answers_status) pending_ += std::to_string(last_status_) + "\r\n";
            pending_ += prompt;
            return true;
        }
        auto it = replies.find(line);
        if (it != replies.end()) {
            pending_ += it->second.output;
            last_status_ = it->second.status;
        } else {
            last_status_ = 0;
        }
        pending_ += prompt;
        return true;
    }

    bool recv_ready() override { return !pending_.empty(); }

    std::string recv(std::size_t max_bytes) override {
        std::string chunk = pending_.substr(0, max_bytes);
        pending_.erase(0, chunk.size());
        return chunk;
    }

    bool recv_stderr_ready() override { return false; }
    std::string recv_stderr(std::size_t) override { return ""; }

    bool eof() override { return closed_by_peer && pending_.empty(); }
    void close() override { log_.closes++; }

    void inject(const std::string& data) { pending_ += data; }

    std::map<std::string, Reply> replies;
    std::string prompt;
    bool answers_status = true;
    bool send_ok = true;
    bool closed_by_peer = false;

private:
    ChannelLog& log_;
    std::string pending_;
    int last_status_ = 0;
};

class FakeHost : public RemoteHost {
public:
    FakeHost() : owned_(std::make_unique<FakeChannel>(log)), channel(owned_.get()) {}

    Result<std::unique_ptr<RemoteChannel>> open_shell(const Environment& env) override {
        shell_env = env;
        if (fail_open || !owned_) {
            return Result<std::unique_ptr<RemoteChannel>>::Err("connection refused");
        }
        return Result<std::unique_ptr<RemoteChannel>>::Ok(std::move(owned_));
    }

    SSHResult exec(const std::string& command) override {
        executed.push_back(command);
        if (command.rfind("test -e ", 0) == 0) {
            return SSHResult{activation_exists ? 0 : 1, "", ""};
        }
        return SSHResult{0, process_table, ""};
    }

    ChannelLog log;
    std::unique_ptr<FakeChannel> owned_;
    FakeChannel* channel;  // owned by the session once opened
    Environment shell_env;
    std::vector<std::string> executed;
    std::string process_table;
    bool activation_exists = false;
    bool fail_open = false;
};
