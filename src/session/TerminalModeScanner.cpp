/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalModeScanner.h"

#include <QUrl>

namespace Trellis
{

static const int MaxCsiLength = 64;
static const int MaxOscLength = 4096;

QJsonObject TerminalModes::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("alternateScreen"), alternateScreen);
    object.insert(QStringLiteral("cursorVisible"), cursorVisible);
    object.insert(QStringLiteral("insertMode"), insertMode);
    object.insert(QStringLiteral("appCursorKeys"), appCursorKeys);
    object.insert(QStringLiteral("appKeypad"), appKeypad);
    object.insert(QStringLiteral("autoWrap"), autoWrap);
    object.insert(QStringLiteral("bracketedPaste"), bracketedPaste);
    object.insert(QStringLiteral("focusReporting"), focusReporting);
    object.insert(QStringLiteral("mouseStandard"), mouseStandard);
    object.insert(QStringLiteral("mouseButton"), mouseButton);
    object.insert(QStringLiteral("mouseAny"), mouseAny);
    object.insert(QStringLiteral("mouseSGR"), mouseSGR);
    return object;
}

TerminalModes TerminalModes::fromJson(const QJsonObject &object)
{
    TerminalModes modes;
    modes.alternateScreen = object.value(QStringLiteral("alternateScreen")).toBool(false);
    modes.cursorVisible = object.value(QStringLiteral("cursorVisible")).toBool(true);
    modes.insertMode = object.value(QStringLiteral("insertMode")).toBool(false);
    modes.appCursorKeys = object.value(QStringLiteral("appCursorKeys")).toBool(false);
    modes.appKeypad = object.value(QStringLiteral("appKeypad")).toBool(false);
    modes.autoWrap = object.value(QStringLiteral("autoWrap")).toBool(true);
    modes.bracketedPaste = object.value(QStringLiteral("bracketedPaste")).toBool(false);
    modes.focusReporting = object.value(QStringLiteral("focusReporting")).toBool(false);
    modes.mouseStandard = object.value(QStringLiteral("mouseStandard")).toBool(false);
    modes.mouseButton = object.value(QStringLiteral("mouseButton")).toBool(false);
    modes.mouseAny = object.value(QStringLiteral("mouseAny")).toBool(false);
    modes.mouseSGR = object.value(QStringLiteral("mouseSGR")).toBool(false);
    return modes;
}

bool TerminalModes::operator==(const TerminalModes &other) const
{
    return alternateScreen == other.alternateScreen && cursorVisible == other.cursorVisible && insertMode == other.insertMode
        && appCursorKeys == other.appCursorKeys && appKeypad == other.appKeypad && autoWrap == other.autoWrap && bracketedPaste == other.bracketedPaste
        && focusReporting == other.focusReporting && mouseStandard == other.mouseStandard && mouseButton == other.mouseButton && mouseAny == other.mouseAny
        && mouseSGR == other.mouseSGR;
}

void TerminalModeScanner::reset()
{
    _state = State::Ground;
    _params.clear();
    _osc.clear();
    _oscOverflow = false;
    _modes = TerminalModes();
}

std::optional<QString> TerminalModeScanner::feed(const QByteArray &data)
{
    std::optional<QString> cwd;

    for (const char c : data) {
        switch (_state) {
        case State::Ground:
            if (c == '\033') {
                _state = State::Escape;
            }
            break;

        case State::Escape:
            escapeByte(c);
            break;

        case State::Csi:
            if (c == '\033') {
                _state = State::Escape;
            } else if (c == 0x18 || c == 0x1a) {
                _state = State::Ground;
            } else if (c >= 0x40 && c <= 0x7e) {
                dispatchCsi(c);
                _state = State::Ground;
            } else if (_params.size() < MaxCsiLength) {
                _params.append(c);
            }
            break;

        case State::Osc:
            if (c == '\a') {
                if (auto reported = dispatchOsc()) {
                    cwd = reported;
                }
                _state = State::Ground;
            } else if (c == '\033') {
                _state = State::OscEscape;
            } else if (_osc.size() < MaxOscLength) {
                _osc.append(c);
            } else {
                _oscOverflow = true;
            }
            break;

        case State::OscEscape:
            if (c == '\\') {
                if (auto reported = dispatchOsc()) {
                    cwd = reported;
                }
                _state = State::Ground;
            } else {
                escapeByte(c);
            }
            break;

        case State::String:
            if (c == '\033') {
                _state = State::StringEscape;
            } else if (c == '\a') {
                _state = State::Ground;
            }
            break;

        case State::StringEscape:
            if (c == '\\') {
                _state = State::Ground;
            } else {
                escapeByte(c);
            }
            break;
        }
    }

    return cwd;
}

void TerminalModeScanner::escapeByte(char c)
{
    switch (c) {
    case '[':
        _params.clear();
        _state = State::Csi;
        return;
    case ']':
        _osc.clear();
        _oscOverflow = false;
        _state = State::Osc;
        return;
    case 'P':
    case 'X':
    case '^':
    case '_':
        _state = State::String;
        return;
    case 'c':
        _modes = TerminalModes();
        break;
    case '=':
        _modes.appKeypad = true;
        break;
    case '>':
        _modes.appKeypad = false;
        break;
    case '\033':
        // ESC ESC: the first one was stray
        return;
    default:
        break;
    }
    _state = State::Ground;
}

void TerminalModeScanner::dispatchCsi(char final)
{
    if (final != 'h' && final != 'l') {
        return;
    }
    const bool on = final == 'h';

    if (!_params.startsWith('?')) {
        for (const QByteArray &param : _params.split(';')) {
            if (param == "4") {
                _modes.insertMode = on;
            }
        }
        return;
    }

    for (const QByteArray &param : _params.mid(1).split(';')) {
        bool ok = false;
        const int mode = param.toInt(&ok);
        if (ok) {
            setPrivateMode(mode, on);
        }
    }
}

void TerminalModeScanner::setPrivateMode(int mode, bool on)
{
    switch (mode) {
    case 1:
        _modes.appCursorKeys = on;
        break;
    case 7:
        _modes.autoWrap = on;
        break;
    case 25:
        _modes.cursorVisible = on;
        break;
    case 47:
    case 1047:
    case 1049:
        _modes.alternateScreen = on;
        break;
    case 1000:
        _modes.mouseStandard = on;
        break;
    case 1002:
        _modes.mouseButton = on;
        break;
    case 1003:
        _modes.mouseAny = on;
        break;
    case 1004:
        _modes.focusReporting = on;
        break;
    case 1006:
        _modes.mouseSGR = on;
        break;
    case 2004:
        _modes.bracketedPaste = on;
        break;
    default:
        break;
    }
}

std::optional<QString> TerminalModeScanner::dispatchOsc()
{
    if (_oscOverflow) {
        return std::nullopt;
    }
    return parseOsc7(_osc);
}

std::optional<QString> TerminalModeScanner::parseOsc7(const QByteArray &payload)
{
    if (!payload.startsWith("7;")) {
        return std::nullopt;
    }

    const QByteArray location = payload.mid(2);
    if (location.startsWith('/')) {
        return QString::fromUtf8(QByteArray::fromPercentEncoding(location));
    }

    const QUrl url(QString::fromUtf8(location));
    if (!url.isValid() || url.scheme() != QLatin1String("file") || url.path().isEmpty()) {
        return std::nullopt;
    }
    return url.path();
}

} // namespace Trellis
