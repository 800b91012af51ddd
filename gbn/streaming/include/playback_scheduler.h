// IRON: iron_headers
/*
 * Distribution A
 *
 * Approved for Public Release, Distribution Unlimited
 *
 * EdgeCT (IRON) Software Contract No.: HR0011-15-C-0097
 * DCOMP (GNAT)  Software Contract No.: HR0011-17-C-0050
 * Copyright (c) 2015-20 Raytheon BBN Technologies Corp.
 *
 * This material is based upon work supported by the Defense Advanced
 * Research Projects Agency under Contracts No. HR0011-15-C-0097 and
 * HR0011-17-C-0050. Any opinions, findings and conclusions or
 * recommendations expressed in this material are those of the author(s)
 * and do not necessarily reflect the views of the Defense Advanced
 * Research Project Agency.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/* IRON: end */

/// \brief The GbnStream playback scheduler header file.
///
/// The playback scheduler removes assembled frames from the playback buffer
/// at a fixed frame rate and hands them to the display.  A frame that is
/// missing at its display time is given a short grace period.  After the
/// grace period the scheduler stalls, waiting for the frame until it arrives
/// or the end of the stream makes its arrival impossible.

#ifndef GBN_STREAMING_PLAYBACK_SCHEDULER_H
#define GBN_STREAMING_PLAYBACK_SCHEDULER_H

#include "config_info.h"
#include "frame_display_if.h"
#include "frame_reassembly_buffer.h"
#include "itime.h"
#include "playback_buffer.h"
#include "qoe_metrics.h"
#include "runnable_if.h"
#include "thread.h"

#include <vector>

#include <pthread.h>
#include <stdint.h>

namespace gbn
{

  /// \brief The playback states.
  enum PlaybackState
  {
    PLAYBACK_RUNNING = 0,
    PLAYBACK_STALLING,
    PLAYBACK_STOPPED
  };

  /// \brief Get a printable name for a playback state.
  const char* PlaybackStateToString(PlaybackState state);

  /// \brief The fixed rate playback loop.
  ///
  /// The loop runs on its own thread.  The scheduler lock is never held
  /// while calling into the buffers, the metrics or the display.
  class PlaybackScheduler : public RunnableIf
  {

   public:

    /// \brief Constructor.
    ///
    /// \param  playback    The buffer of assembled frames.
    /// \param  reassembly  The reassembly buffer, trimmed as playback
    ///                     advances.
    /// \param  metrics     The QoE metrics.
    /// \param  display     The display.  May be NULL, in which case
    ///                     displayed frames are only counted.
    PlaybackScheduler(PlaybackBuffer& playback,
                      FrameReassemblyBuffer& reassembly,
                      QoeMetrics& metrics, FrameDisplayIf* display);

    /// \brief Destructor.  Stops the playback thread.
    virtual ~PlaybackScheduler();

    /// \brief Configure from Stream.Fps, Stream.StartFrameId and
    /// Stream.EvictLagFrames.
    ///
    /// \param  ci  The configuration.
    ///
    /// \return  True on success.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Configure the scheduler.  Not allowed once started.
    ///
    /// \param  fps             The playback frame rate.  Must be positive.
    /// \param  start_frame_id  The first frame id to display.
    /// \param  evict_lag       The number of frames behind the expected
    ///                         frame at which partial frames are evicted.
    ///
    /// \return  True on success.
    bool Configure(double fps, uint32_t start_frame_id, uint32_t evict_lag);

    /// \brief Start the playback thread.
    ///
    /// \return  True on success.
    bool Start();

    /// \brief Stop playback and join the playback thread.  Returns within
    /// one polling interval plus the time spent in the display.
    void Stop();

    /// \brief Wait for playback to reach the STOPPED state.
    ///
    /// \param  max_wait  The maximum time to wait.
    ///
    /// \return  True if playback stopped.
    bool WaitUntilStopped(const Time& max_wait);

    /// \brief Record that the end-of-stream sentinel was received.  No frame
    /// can be inserted into the playback buffer after this.
    void NotifyEndOfStream();

    /// \brief Get the playback state.
    PlaybackState GetState() const;

    /// \brief Get the id of the next frame to be displayed.
    uint32_t expected_frame_id() const;

    /// \brief The playback loop.
    virtual void Run();

   private:

    /// \brief The result of one playback cycle.
    enum CycleResult
    {
      CYCLE_DISPLAYED = 0,   ///< The frame was displayed.
      CYCLE_SKIPPED,         ///< The frame was refused by the full buffer.
      CYCLE_DROPPED,         ///< The frame can no longer arrive.
      CYCLE_CANCELLED        ///< Stop() was called.
    };

    /// \brief Copy constructor.
    PlaybackScheduler(const PlaybackScheduler& other);

    /// \brief Copy operator.
    PlaybackScheduler& operator=(const PlaybackScheduler& other);

    /// \brief Sleep until a display time.
    ///
    /// \return  False if Stop() was called.
    bool WaitUntil(const Time& display_time);

    /// \brief Run one playback cycle for a frame.
    CycleResult PlayFrame(uint32_t frame_id);

    /// \brief Wait for a frame that missed its grace period.
    CycleResult Stall(uint32_t frame_id);

    /// \brief Hand a frame to the display.
    void Display(uint32_t frame_id, const std::vector<uint8_t>& frame);

    /// \brief Set the state and wake up WaitUntilStopped() callers.
    void SetState(PlaybackState state);

    bool IsStopRequested() const;

    bool IsEndOfStream() const;

    /// The playback buffer.
    PlaybackBuffer&          playback_;

    /// The reassembly buffer.
    FrameReassemblyBuffer&   reassembly_;

    /// The QoE metrics.
    QoeMetrics&              metrics_;

    /// The display.
    FrameDisplayIf*          display_;

    /// The time between frames.
    Time                     frame_interval_;

    /// The grace period for a late frame.
    Time                     grace_;

    /// The first frame id to display.
    uint32_t                 start_frame_id_;

    /// The eviction lag, in frames.
    uint32_t                 evict_lag_;

    /// The id of the next frame to display.
    uint32_t                 expected_frame_id_;

    /// The playback state.
    PlaybackState            state_;

    /// Whether the end-of-stream sentinel was received.
    bool                     eos_;

    /// Whether the playback thread was started.
    bool                     started_;

    /// Whether Stop() was called.
    bool                     stop_requested_;

    /// The playback thread.
    Thread                   thread_;

    /// Protects the members above.
    mutable pthread_mutex_t  mutex_;

    /// Signaled on Stop(), at the end of the stream and on state changes.
    pthread_cond_t           cond_;

  }; // end class PlaybackScheduler

} // namespace gbn

#endif // GBN_STREAMING_PLAYBACK_SCHEDULER_H
