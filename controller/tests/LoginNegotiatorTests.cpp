#include "moiplink/line/LoginNegotiator.h"

#include <catch2/catch_test_macros.hpp>

using moiplink::line::LoginNegotiator;
using Action = LoginNegotiator::Action;

TEST_CASE("LoginNegotiator answers username and password prompts", "[line]") {
    LoginNegotiator negotiator(true, 3);

    REQUIRE(negotiator.onText("MoIP Controller\r\nlog") == Action::None);
    REQUIRE(negotiator.onText("in: ") == Action::SendUsername);
    REQUIRE(negotiator.onText("Password: ") == Action::SendPassword);
    REQUIRE(negotiator.onText("Welcome to the controller\r\n") == Action::Authenticated);
    REQUIRE(negotiator.attempts() == 1);
}

TEST_CASE("LoginNegotiator accepts a silent port", "[line]") {
    SECTION("no prompt at all") {
        LoginNegotiator negotiator(false, 3);
        REQUIRE(negotiator.onQuiet() == Action::Authenticated);
    }

    SECTION("protocol output instead of a prompt") {
        LoginNegotiator negotiator(true, 3);
        REQUIRE(negotiator.onText("~Receivers=1:1\r\n") == Action::Authenticated);
    }

    SECTION("quiet after the password") {
        LoginNegotiator negotiator(true, 3);
        REQUIRE(negotiator.onText("Username:") == Action::SendUsername);
        REQUIRE(negotiator.onText("Password:") == Action::SendPassword);
        REQUIRE(negotiator.onQuiet() == Action::Authenticated);
    }
}

TEST_CASE("LoginNegotiator gives up after repeated rejections", "[line]") {
    LoginNegotiator negotiator(true, 2);

    REQUIRE(negotiator.onText("login: ") == Action::SendUsername);
    REQUIRE(negotiator.onText("Password: ") == Action::SendPassword);
    REQUIRE(negotiator.onText("Login incorrect\r\nlogin: ") == Action::SendUsername);
    REQUIRE(negotiator.onText("Password: ") == Action::SendPassword);
    REQUIRE(negotiator.onText("Login incorrect\r\nlogin: ") == Action::Rejected);
    REQUIRE_FALSE(negotiator.reason().empty());
}

TEST_CASE("LoginNegotiator rejects a prompt without credentials", "[line]") {
    LoginNegotiator negotiator(false, 3);
    REQUIRE(negotiator.onText("login: ") == Action::Rejected);
}
