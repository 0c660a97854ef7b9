#ifndef LOGQ_INPUT_SOURCE_HPP
#define LOGQ_INPUT_SOURCE_HPP

#include <cstddef>

namespace logq {

    namespace keys {
        const int kCtrlC = 3;
        const int kCtrlD = 4;
        const int kBackspaceAlt = 8;
        const int kLineFeed = 10;
        const int kCtrlL = 12;
        const int kEnter = 13;
        const int kCtrlU = 21;
        const int kEscape = 27;
        const int kBackspace = 127;
    } // namespace keys

    /// What woke the controller: a keypress, a tailer notification, a
    /// terminal resize, or a request to stop.
    struct InputEvent {
        enum class Type {
            Key,
            Wake,
            Resize,
            Interrupt,
            EndOfInput
        };

        Type type;
        int key;
        size_t rows;
        size_t columns;

        InputEvent() : type(Type::EndOfInput), key(0), rows(0), columns(0) {}

        static InputEvent makeKey(int k) {
            InputEvent e;
            e.type = Type::Key;
            e.key = k;
            return e;
        }

        static InputEvent make(Type t) {
            InputEvent e;
            e.type = t;
            return e;
        }

        static InputEvent makeResize(size_t r, size_t c) {
            InputEvent e;
            e.type = Type::Resize;
            e.rows = r;
            e.columns = c;
            return e;
        }
    };

    /// Blocking event source. next() returns whichever happens first.
    class IInputSource {
    public:
        virtual ~IInputSource() = default;

        virtual InputEvent next() = 0;
    };

} // namespace logq

#endif // LOGQ_INPUT_SOURCE_HPP
