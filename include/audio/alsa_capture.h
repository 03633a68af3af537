/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * ALSA Capture - Non-blocking microphone source behind session_capture_t
 */

#ifndef ALSA_CAPTURE_H
#define ALSA_CAPTURE_H

#include "config/parley_config.h"
#include "session/session_capabilities.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct alsa_capture alsa_capture_t;

/**
 * @brief Create a capture source for audio.capture_device
 *
 * The device is opened on start() and closed on stop(), so the microphone
 * is only held while the session is listening.
 */
alsa_capture_t *alsa_capture_create(const parley_config_t *config);

void alsa_capture_destroy(alsa_capture_t *capture);

/**
 * @brief Fill a session_capture_t that reads from this source
 */
void alsa_capture_bind(alsa_capture_t *capture, session_capture_t *out);

#ifdef __cplusplus
}
#endif

#endif /* ALSA_CAPTURE_H */
