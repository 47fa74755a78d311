/**
 * @file key_codes.hpp
 * @brief Remote-control keys and their wire names.
 */
#pragma once
#include <optional>
#include <string_view>

namespace framectl {

    enum class Key {
        Power, PowerOff,
        VolumeUp, VolumeDown, Mute,
        Up, Down, Left, Right, Enter, Return,
        Play, Pause, Stop, Rewind, FastForward,
        ChannelUp, ChannelDown, PreviousChannel,
        Menu, Home, Exit, Source, Tools,
        Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9
    };

    /// How the key is pressed: a full click, or press/release for holds.
    enum class KeyAction { Click, Press, Release };

    enum class Direction { Up, Down, Left, Right };

    std::string_view toString(Key k);          ///< e.g. "KEY_VOLUP"
    std::string_view toString(KeyAction a);    ///< "Click" / "Press" / "Release"
    std::optional<Key> keyFromString(std::string_view s);
    Key keyFor(Direction d);
    Key digitKey(int digit);                   ///< @throws ValidationError outside 0..9

}
