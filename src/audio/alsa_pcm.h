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
 */

/* Shared ALSA device setup for capture and playback (internal) */

#ifndef ALSA_PCM_H
#define ALSA_PCM_H

#include <alsa/asoundlib.h>

/**
 * @brief Open a PCM device non-blocking with S16_LE interleaved access
 *
 * @param handle Receives the open handle (NULL on failure)
 * @param device ALSA device name
 * @param stream SND_PCM_STREAM_CAPTURE or SND_PCM_STREAM_PLAYBACK
 * @param rate Sample rate in Hz (exact match required)
 * @param channels Channel count
 * @param period_frames Requested period size in frames
 * @return 0 on success, 1 on failure (logged)
 */
int alsa_pcm_open(snd_pcm_t **handle,
                  const char *device,
                  snd_pcm_stream_t stream,
                  unsigned int rate,
                  unsigned int channels,
                  snd_pcm_uframes_t period_frames);

#endif /* ALSA_PCM_H */
