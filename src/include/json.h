/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#ifndef JSON_H
#define JSON_H

#include <nlohmann/json.hpp>

using json = nlohmann::json;

#endif // JSON_H
