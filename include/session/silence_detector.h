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
 * Silence Detector - energy-based end-of-utterance detection
 *
 * Each chunk is classified by its mean absolute amplitude. Silence only
 * counts once voice has been heard in the current turn, so a user who has
 * not started speaking yet is never cut off.
 */

#ifndef SILENCE_DETECTOR_H
#define SILENCE_DETECTOR_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
   int threshold;           /* Mean |sample| at or below this is silence */
   uint32_t duration_ms;    /* Silence needed to end the utterance */
   unsigned int sample_rate;
   unsigned int channels;

   bool had_voice;          /* Voice seen since the last reset */
   uint32_t silence_ms;     /* Accumulated trailing silence */
} silence_detector_t;

/**
 * @brief Initialize a detector
 */
void silence_detector_init(silence_detector_t *det,
                           int threshold,
                           uint32_t duration_ms,
                           unsigned int sample_rate,
                           unsigned int channels);

/**
 * @brief Forget voice and silence history (start of a new user turn)
 */
void silence_detector_reset(silence_detector_t *det);

/**
 * @brief Mean absolute amplitude of S16LE samples
 *
 * @return Mean |sample|, 0 for empty input
 */
int silence_detector_level(const uint8_t *pcm, size_t len);

/**
 * @brief Feed one chunk of captured audio
 *
 * @param det Detector
 * @param pcm S16LE samples
 * @param len Bytes
 * @return true once trailing silence after voice reaches duration_ms
 */
bool silence_detector_process(silence_detector_t *det, const uint8_t *pcm, size_t len);

#ifdef __cplusplus
}
#endif

#endif /* SILENCE_DETECTOR_H */
