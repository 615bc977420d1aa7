#pragma once

#include <map>
#include <string>
#include <vector>

namespace trellis {

/// Toolkit-independent key codes.
enum class Key : int {
    Unknown = 0,

    A = 65, B = 66, C = 67, D = 68, E = 69, F = 70, G = 71, H = 72,
    I = 73, J = 74, K = 75, L = 76, M = 77, N = 78, O = 79, P = 80,
    Q = 81, R = 82, S = 83, T = 84, U = 85, V = 86, W = 87, X = 88,
    Y = 89, Z = 90,

    Up = 265, Down = 264, Left = 263, Right = 262,

    Space = 32,
    Enter = 257,
    Escape = 256,
    Backspace = 259,
    Tab = 258,
    Delete = 261,
    Home = 268,
    End = 269,
    PageUp = 266,
    PageDown = 267,
};

/// Modifier state delivered with every input event.
struct KeyboardModifiers {
    bool shift = false;
    bool control = false;
    bool alt = false;
    bool meta = false;

    bool any() const { return shift || control || alt || meta; }
    bool operator==(const KeyboardModifiers&) const = default;

    static KeyboardModifiers none() { return {}; }
    static KeyboardModifiers withShift() { KeyboardModifiers m; m.shift = true; return m; }
};

struct KeyEvent {
    Key key = Key::Unknown;
    std::string text;
    KeyboardModifiers modifiers;
};

/// Payload of a drag operation, keyed by MIME type.
struct MimeData {
    std::map<std::string, std::string> data;

    bool hasFormat(const std::string& format) const { return data.contains(format); }
    std::vector<std::string> formats() const {
        std::vector<std::string> out;
        for (const auto& [format, value] : data) out.push_back(format);
        return out;
    }
};

/// Result of drag handlers. Ignore means "not handled here".
enum class DragAction {
    Ignore,
    Copy,
    Move,
    Link
};

} // namespace trellis
