#include "framectl/commands/remote_control.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include <format>
#include <thread>

namespace framectl {

    namespace {
        constexpr const char* kRemoteMethod = "ms.remote.control";
    }

    nlohmann::json RemoteControl::keyParams(Key key, KeyAction action) {
        return {
            {"Cmd", std::string(toString(action))},
            {"DataOfCmd", std::string(toString(key))},
            {"Option", "false"},
            {"TypeOfRemote", "SendRemoteKey"},
        };
    }

    void RemoteControl::sendKey(Key key, KeyAction action) {
        session_.auth().requireScope(TokenScope::RemoteControl);
        LOG_DEBUG(std::format("key {} {}", toString(key), toString(action)));
        if (opts_.awaitAck)
            session_.call(kRemoteMethod, keyParams(key, action));
        else
            session_.post(kRemoteMethod, keyParams(key, action));
    }

    void RemoteControl::sendKeys(const std::vector<Key>& keys, std::optional<std::chrono::milliseconds> delay) {
        auto pause = delay.value_or(opts_.keyDelay);
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0 && pause.count() > 0) std::this_thread::sleep_for(pause);
            sendKey(keys[i]);
        }
    }

    void RemoteControl::volumeUp(int steps) {
        if (steps < 1) throw ValidationError("volume steps must be positive");
        sendKeys(std::vector<Key>(static_cast<size_t>(steps), Key::VolumeUp));
    }

    void RemoteControl::volumeDown(int steps) {
        if (steps < 1) throw ValidationError("volume steps must be positive");
        sendKeys(std::vector<Key>(static_cast<size_t>(steps), Key::VolumeDown));
    }

    void RemoteControl::hold(Key key, std::chrono::milliseconds duration) {
        sendKey(key, KeyAction::Press);
        std::this_thread::sleep_for(duration);
        sendKey(key, KeyAction::Release);
    }

}
