/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef METADATER_H
#define METADATER_H

#define MTD_LOG_ENV "METADATER_LOG"
#define MTD_DEBUG_ENV "METADATER_DEBUG"

/** This must be called as the very first function
 * of every metadater process/program
 * @param verbose whether the program should output debug messages */
void MTDRegisterProcess(bool verbose = false);

/** Get library version */
const char* MTDGetVersion();

#endif // METADATER_H
