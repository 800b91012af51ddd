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

/// \brief The GbnStream quality of experience metrics header file.

#ifndef GBN_STREAMING_QOE_METRICS_H
#define GBN_STREAMING_QOE_METRICS_H

#include "itime.h"

#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <string>

#include <pthread.h>
#include <stdint.h>

namespace gbn
{

  /// \brief A point-in-time snapshot of the QoE metrics.
  struct QoeStats
  {
    QoeStats()
        : received_chunks_total(0), frames_reassembled_total(0),
          dropped_frames(0), stall_time_seconds(0.0), eos_received(false),
          frames_displayed(0), stall_count(0), playback_overflow_drops(0)
    { }

    /// Chunk payloads parsed, the end-of-stream sentinel included.
    uint64_t  received_chunks_total;

    /// Frames assembled and accepted by the playback buffer.
    uint64_t  frames_reassembled_total;

    /// Frames that were never displayed.
    uint64_t  dropped_frames;

    /// Cumulative time spent stalled.
    double    stall_time_seconds;

    /// Whether the end-of-stream sentinel arrived.
    bool      eos_received;

    /// Frames handed to the display.
    uint64_t  frames_displayed;

    /// Number of stalls.
    uint64_t  stall_count;

    /// Frames refused by a full playback buffer.  Also counted in
    /// dropped_frames.
    uint64_t  playback_overflow_drops;

  }; // end struct QoeStats

  /// \brief Thread-safe QoE counters fed by the receive and playback paths.
  class QoeMetrics
  {

   public:

    /// \brief Constructor.
    QoeMetrics();

    /// \brief Destructor.
    virtual ~QoeMetrics();

    void IncrementChunksReceived();

    void IncrementFramesReassembled();

    void IncrementDroppedFrames();

    void IncrementFramesDisplayed();

    /// \brief Count a frame refused by a full playback buffer, as an
    /// overflow drop and as a dropped frame.
    void IncrementOverflowDrops();

    /// \brief Count the start of a stall.
    void IncrementStallCount();

    /// \brief Add the duration of a stall.
    ///
    /// \param  duration  The stall duration.
    void AddStallTime(const Time& duration);

    /// \brief Record that the end-of-stream sentinel arrived.
    void SetEosReceived();

    /// \brief Check if the end-of-stream sentinel arrived.
    bool IsEosReceived() const;

    /// \brief Get a snapshot of the metrics.
    QoeStats GetStats() const;

    /// \brief Write the metrics as JSON object members.
    ///
    /// \param  writer  The writer.
    void WriteStats(rapidjson::Writer<rapidjson::StringBuffer>* writer) const;

    /// \brief Get the metrics as a one line string.
    std::string ToString() const;

    /// \brief Reset all metrics.
    void Reset();

   private:

    /// \brief Copy constructor.
    QoeMetrics(const QoeMetrics& other);

    /// \brief Copy operator.
    QoeMetrics& operator=(const QoeMetrics& other);

    /// The metrics.
    QoeStats                 stats_;

    /// The cumulative stall time.
    Time                     stall_time_;

    /// Protects the members above.
    mutable pthread_mutex_t  mutex_;

  }; // end class QoeMetrics

} // namespace gbn

#endif // GBN_STREAMING_QOE_METRICS_H
