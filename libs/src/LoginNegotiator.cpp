#include "moiplink/line/LoginNegotiator.h"

#include "moiplink/line/LineFramer.h"

#include <algorithm>
#include <cctype>

namespace moiplink::line {

namespace {

constexpr std::size_t kWindowLimit = 512;

std::string lowerCopy(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

bool endsWithPrompt(const std::string& window, std::string_view prompt) {
    auto end = window.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return false;
    }
    std::string_view trimmed(window.data(), end + 1);
    return trimmed.size() >= prompt.size() &&
           trimmed.compare(trimmed.size() - prompt.size(), prompt.size(), prompt) == 0;
}

bool mentionsFailure(const std::string& window) {
    for (std::string_view marker : {"incorrect", "invalid", "denied", "failed"}) {
        if (window.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool containsProtocolLine(const std::string& window) {
    std::size_t start = 0;
    while (start < window.size()) {
        auto end = window.find('\n', start);
        if (end == std::string::npos) {
            break;
        }
        std::string_view line(window.data() + start, end - start);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.remove_suffix(1);
        }
        // window is lower-cased, so "OK" shows up as "ok".
        if (line == "ok" || classifyLine(line)) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

}  // namespace

LoginNegotiator::LoginNegotiator(bool haveCredentials, int maxAttempts)
    : haveCredentials_(haveCredentials), maxAttempts_(maxAttempts) {}

LoginNegotiator::Action LoginNegotiator::onText(std::string_view received) {
    if (stage_ == Stage::Done) {
        return Action::None;
    }
    window_ += lowerCopy(received);
    if (window_.size() > kWindowLimit) {
        window_.erase(0, window_.size() - kWindowLimit);
    }

    const bool userPrompt = endsWithPrompt(window_, "login:") || endsWithPrompt(window_, "username:") ||
                            endsWithPrompt(window_, "user:");
    const bool passwordPrompt = endsWithPrompt(window_, "password:");

    if (userPrompt) {
        if (!haveCredentials_) {
            return reject("controller requested a login but no telnet credentials are configured");
        }
        if (attempts_ >= maxAttempts_) {
            return reject("login rejected after " + std::to_string(attempts_) + " attempt(s)");
        }
        ++attempts_;
        stage_ = Stage::UsernameSent;
        window_.clear();
        return Action::SendUsername;
    }

    if (passwordPrompt) {
        if (!haveCredentials_) {
            return reject("controller requested a password but no telnet credentials are configured");
        }
        if (stage_ != Stage::UsernameSent) {
            // Password-only login counts as one cycle.
            if (attempts_ >= maxAttempts_) {
                return reject("login rejected after " + std::to_string(attempts_) + " attempt(s)");
            }
            ++attempts_;
        }
        stage_ = Stage::PasswordSent;
        window_.clear();
        return Action::SendPassword;
    }

    if (stage_ == Stage::PasswordSent) {
        if (mentionsFailure(window_)) {
            if (attempts_ >= maxAttempts_) {
                return reject("login rejected after " + std::to_string(attempts_) + " attempt(s)");
            }
            // Wait for the next prompt cycle.
            return Action::None;
        }
        if (containsProtocolLine(window_) || window_.find("welcome") != std::string::npos) {
            stage_ = Stage::Done;
            return Action::Authenticated;
        }
    } else if (stage_ == Stage::AwaitingPrompt && containsProtocolLine(window_)) {
        stage_ = Stage::Done;
        return Action::Authenticated;
    }
    return Action::None;
}

LoginNegotiator::Action LoginNegotiator::onQuiet() {
    switch (stage_) {
    case Stage::PasswordSent:
        if (mentionsFailure(window_)) {
            return reject("login rejected after " + std::to_string(attempts_) + " attempt(s)");
        }
        stage_ = Stage::Done;
        return Action::Authenticated;
    case Stage::AwaitingPrompt:
        // No prompt at all: the port does not require a login.
        stage_ = Stage::Done;
        return Action::Authenticated;
    case Stage::UsernameSent:
    case Stage::Done:
        break;
    }
    return Action::None;
}

LoginNegotiator::Action LoginNegotiator::reject(std::string reason) {
    stage_ = Stage::Done;
    reason_ = std::move(reason);
    return Action::Rejected;
}

}  // namespace moiplink::line
