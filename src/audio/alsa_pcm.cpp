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

#include "alsa_pcm.h"

#include "logging_common.h"

int alsa_pcm_open(snd_pcm_t **handle,
                  const char *device,
                  snd_pcm_stream_t stream,
                  unsigned int rate,
                  unsigned int channels,
                  snd_pcm_uframes_t period_frames) {
   snd_pcm_hw_params_t *params = NULL;
   unsigned int actual_rate = rate;
   int dir = 0;
   const char *what = (stream == SND_PCM_STREAM_CAPTURE) ? "capture" : "playback";

   *handle = NULL;
   int rc = snd_pcm_open(handle, device, stream, SND_PCM_NONBLOCK);
   if (rc < 0) {
      PARLEY_LOG_ERROR("ALSA: unable to open %s device %s: %s", what, device, snd_strerror(rc));
      *handle = NULL;
      return 1;
   }

   snd_pcm_hw_params_alloca(&params);
   snd_pcm_hw_params_any(*handle, params);
   snd_pcm_hw_params_set_access(*handle, params, SND_PCM_ACCESS_RW_INTERLEAVED);
   snd_pcm_hw_params_set_format(*handle, params, SND_PCM_FORMAT_S16_LE);
   snd_pcm_hw_params_set_channels(*handle, params, channels);
   snd_pcm_hw_params_set_rate_near(*handle, params, &actual_rate, &dir);
   snd_pcm_hw_params_set_period_size_near(*handle, params, &period_frames, &dir);
   rc = snd_pcm_hw_params(*handle, params);
   if (rc < 0) {
      PARLEY_LOG_ERROR("ALSA: unable to set %s hw parameters: %s", what, snd_strerror(rc));
      snd_pcm_close(*handle);
      *handle = NULL;
      return 1;
   }

   if (actual_rate != rate) {
      PARLEY_LOG_ERROR("ALSA: %s device %s does not support %u Hz (got %u)", what, device, rate,
                       actual_rate);
      snd_pcm_close(*handle);
      *handle = NULL;
      return 1;
   }

   rc = snd_pcm_prepare(*handle);
   if (rc < 0) {
      PARLEY_LOG_ERROR("ALSA: cannot prepare %s device: %s", what, snd_strerror(rc));
      snd_pcm_close(*handle);
      *handle = NULL;
      return 1;
   }

   PARLEY_LOG_INFO("ALSA: opened %s device %s (%u Hz, %u ch, period %lu frames)", what, device,
                   rate, channels, static_cast<unsigned long>(period_frames));
   return 0;
}
