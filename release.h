/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef RELEASE_H
#define RELEASE_H

#include <string>

#define PEP_VERSION_MAJOR 0
#define PEP_VERSION_MINOR 2
#define PEP_VERSION_PATCH 0
#define PEP_VERSION_TWEAK 0

#define PEP__STRINGIFY(x) #x
#define PEP_STRINGIFY(x) PEP__STRINGIFY(x)

#define PEP_VERSION_STRING \
PEP_STRINGIFY(PEP_VERSION_MAJOR) "." \
    PEP_STRINGIFY(PEP_VERSION_MINOR) "." \
    PEP_STRINGIFY(PEP_VERSION_PATCH) "." \
    PEP_STRINGIFY(PEP_VERSION_TWEAK)

const std::string g_version_datetime = "20261019";

const std::string g_version = std::string("version ") + std::string(PEP_VERSION_STRING) + " - " + g_version_datetime;

#endif // RELEASE_H
