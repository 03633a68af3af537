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
 * ALSA Sink - Non-blocking speaker output behind session_sink_t
 */

#ifndef ALSA_SINK_H
#define ALSA_SINK_H

#include "config/parley_config.h"
#include "session/session_capabilities.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct alsa_sink alsa_sink_t;

/**
 * @brief Create a playback sink for audio.playback_device
 *
 * write() never blocks: when the device buffer cannot take the whole chunk
 * it returns SINK_ERR_BUSY and the session retries the same chunk later.
 * stop() drops anything still queued in the device.
 */
alsa_sink_t *alsa_sink_create(const parley_config_t *config);

void alsa_sink_destroy(alsa_sink_t *sink);

void alsa_sink_bind(alsa_sink_t *sink, session_sink_t *out);

#ifdef __cplusplus
}
#endif

#endif /* ALSA_SINK_H */
