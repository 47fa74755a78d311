/**
 * @file remote_control.hpp
 * @brief Remote-control key commands over the control channel.
 *
 * Frame: {"method":"ms.remote.control","params":{"Cmd":"Click",
 *         "DataOfCmd":"KEY_POWER","Option":"false","TypeOfRemote":"SendRemoteKey"}}
 */
#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "framectl/commands/key_codes.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/session/connection_session.hpp"

namespace framectl {

    class RemoteControl {
    public:
        RemoteControl(ConnectionSession& session, RemoteOptions opts = {})
            : session_(session), opts_(opts) {}

        static nlohmann::json keyParams(Key key, KeyAction action = KeyAction::Click);

        /**
         * @brief Send one key.
         * @throws AuthenticationError(ScopeInsufficient), TransportError, CallError (awaitAck only)
         */
        void sendKey(Key key, KeyAction action = KeyAction::Click);

        /**
         * @brief Send keys in order, pausing between them (default: RemoteOptions::keyDelay).
         */
        void sendKeys(const std::vector<Key>& keys, std::optional<std::chrono::milliseconds> delay = std::nullopt);

        void power()            { sendKey(Key::Power); }
        void powerOff()         { sendKey(Key::PowerOff); }
        void mute()             { sendKey(Key::Mute); }
        void volumeUp(int steps = 1);
        void volumeDown(int steps = 1);
        void navigate(Direction d) { sendKey(keyFor(d)); }
        void enter()            { sendKey(Key::Enter); }
        void back()             { sendKey(Key::Return); }
        void home()             { sendKey(Key::Home); }
        void channelUp()        { sendKey(Key::ChannelUp); }
        void channelDown()      { sendKey(Key::ChannelDown); }

        /**
         * @brief Hold a key for @p duration (Press, wait, Release).
         */
        void hold(Key key, std::chrono::milliseconds duration);

    private:
        ConnectionSession&  session_;
        RemoteOptions       opts_;
    };

}
