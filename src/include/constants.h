/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#ifndef CONSTANTS_H
#define CONSTANTS_H

#ifndef APP_VERSION
#define APP_VERSION "dev"
#endif

#define DEFAULT_STRATEGIES "exif,json,filename"
#define DEFAULT_NAME_FORMATS "IMG_%Y%m%d_%H%M%S"
#define DEFAULT_SKIP_EXTENSIONS "json,gif"

#define SIDECAR_EXTENSION ".json"
#define EXIF_DATETIME_FORMAT "%Y:%m:%d %H:%M:%S"

// Sidecar GPS pair meaning "no location"
#define SIDECAR_NO_GPS_LATITUDE 0.0
#define SIDECAR_NO_GPS_LONGITUDE 0.0

#endif // CONSTANTS_H
