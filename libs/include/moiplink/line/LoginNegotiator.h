#pragma once

#include <string>
#include <string_view>

namespace moiplink::line {

// Drives the username/password prompt exchange that precedes the control
// session. Fed with raw text (prompts are not newline-terminated) and with
// quiet periods; tells the transport what to send next.
class LoginNegotiator {
public:
    enum class Action {
        None,
        SendUsername,
        SendPassword,
        Authenticated,
        Rejected,
    };

    LoginNegotiator(bool haveCredentials, int maxAttempts);

    Action onText(std::string_view received);
    // Called when nothing arrived within the settle window.
    Action onQuiet();

    int attempts() const noexcept { return attempts_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    enum class Stage {
        AwaitingPrompt,
        UsernameSent,
        PasswordSent,
        Done,
    };

    Action reject(std::string reason);

    bool haveCredentials_;
    int maxAttempts_;
    int attempts_{0};
    Stage stage_{Stage::AwaitingPrompt};
    std::string window_;
    std::string reason_;
};

}  // namespace moiplink::line
