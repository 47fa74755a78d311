#include "framectl/commands/key_codes.hpp"
#include "framectl/core/util/error_types.hpp"
#include <array>
#include <string>
#include <utility>

namespace framectl {

    namespace {
        constexpr std::array<std::pair<Key, std::string_view>, 34> kKeys{ {
            { Key::Power,           "KEY_POWER" },
            { Key::PowerOff,        "KEY_POWEROFF" },
            { Key::VolumeUp,        "KEY_VOLUP" },
            { Key::VolumeDown,      "KEY_VOLDOWN" },
            { Key::Mute,            "KEY_MUTE" },
            { Key::Up,              "KEY_UP" },
            { Key::Down,            "KEY_DOWN" },
            { Key::Left,            "KEY_LEFT" },
            { Key::Right,           "KEY_RIGHT" },
            { Key::Enter,           "KEY_ENTER" },
            { Key::Return,          "KEY_RETURN" },
            { Key::Play,            "KEY_PLAY" },
            { Key::Pause,           "KEY_PAUSE" },
            { Key::Stop,            "KEY_STOP" },
            { Key::Rewind,          "KEY_REWIND" },
            { Key::FastForward,     "KEY_FF" },
            { Key::ChannelUp,       "KEY_CHUP" },
            { Key::ChannelDown,     "KEY_CHDOWN" },
            { Key::PreviousChannel, "KEY_PRECH" },
            { Key::Menu,            "KEY_MENU" },
            { Key::Home,            "KEY_HOME" },
            { Key::Exit,            "KEY_EXIT" },
            { Key::Source,          "KEY_SOURCE" },
            { Key::Tools,           "KEY_TOOLS" },
            { Key::Num0,            "KEY_0" },
            { Key::Num1,            "KEY_1" },
            { Key::Num2,            "KEY_2" },
            { Key::Num3,            "KEY_3" },
            { Key::Num4,            "KEY_4" },
            { Key::Num5,            "KEY_5" },
            { Key::Num6,            "KEY_6" },
            { Key::Num7,            "KEY_7" },
            { Key::Num8,            "KEY_8" },
            { Key::Num9,            "KEY_9" },
        } };
    }

    std::string_view toString(Key k) {
        for (auto const& [key, name] : kKeys)
            if (key == k) return name;
        return "KEY_UNKNOWN";
    }

    std::string_view toString(KeyAction a) {
        switch (a) {
        case KeyAction::Press:   return "Press";
        case KeyAction::Release: return "Release";
        default:                 return "Click";
        }
    }

    std::optional<Key> keyFromString(std::string_view s) {
        for (auto const& [key, name] : kKeys)
            if (name == s) return key;
        return std::nullopt;
    }

    Key keyFor(Direction d) {
        switch (d) {
        case Direction::Up:   return Key::Up;
        case Direction::Down: return Key::Down;
        case Direction::Left: return Key::Left;
        default:              return Key::Right;
        }
    }

    Key digitKey(int digit) {
        if (digit < 0 || digit > 9)
            throw ValidationError("digit out of range: " + std::to_string(digit));
        return static_cast<Key>(static_cast<int>(Key::Num0) + digit);
    }

}
