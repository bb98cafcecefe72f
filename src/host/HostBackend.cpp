/*
    SPDX-FileCopyrightText: 2025 Trellis contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "HostBackend.h"

namespace Trellis
{

HostBackend::HostBackend(QObject *parent)
    : QObject(parent)
{
}

HostBackend::~HostBackend() = default;

} // namespace Trellis

#include "moc_HostBackend.cpp"
