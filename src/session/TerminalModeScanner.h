/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALMODESCANNER_H
#define TERMINALMODESCANNER_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <optional>

#include "trellisprivate_export.h"

namespace Trellis
{

struct TRELLISPRIVATE_EXPORT TerminalModes {
    bool alternateScreen = false;
    bool cursorVisible = true;
    bool insertMode = false;
    bool appCursorKeys = false;
    bool appKeypad = false;
    bool autoWrap = true;
    bool bracketedPaste = false;
    bool focusReporting = false;
    bool mouseStandard = false;
    bool mouseButton = false;
    bool mouseAny = false;
    bool mouseSGR = false;

    QJsonObject toJson() const;
    static TerminalModes fromJson(const QJsonObject &object);

    bool operator==(const TerminalModes &other) const;
    bool operator!=(const TerminalModes &other) const
    {
        return !(*this == other);
    }
};

/**
 * Incremental scanner over raw terminal output.
 *
 * Tracks DEC private modes set with CSI ? Pm h / CSI ? Pm l and picks up
 * OSC 7 working-directory reports. Sequences may be split across feed()
 * calls. Everything else passes through uninterpreted.
 */
class TRELLISPRIVATE_EXPORT TerminalModeScanner
{
public:
    /** Returns the last working directory reported inside @p data. */
    std::optional<QString> feed(const QByteArray &data);

    const TerminalModes &modes() const
    {
        return _modes;
    }

    void setModes(const TerminalModes &modes)
    {
        _modes = modes;
    }

    void reset();

    /** Path of an OSC 7 payload ("7;file://host/path"), or nullopt. */
    static std::optional<QString> parseOsc7(const QByteArray &payload);

private:
    enum class State { Ground, Escape, Csi, Osc, OscEscape, String, StringEscape };

    void escapeByte(char c);
    void dispatchCsi(char final);
    void setPrivateMode(int mode, bool on);
    std::optional<QString> dispatchOsc();

    State _state = State::Ground;
    QByteArray _params;
    QByteArray _osc;
    bool _oscOverflow = false;
    TerminalModes _modes;
};

} // namespace Trellis

#endif // TERMINALMODESCANNER_H
