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

/// \brief The GbnStream loss model header file.
///
/// Provides the GBN sender with a configurable packet loss injector.

#ifndef GBN_TRANSPORT_LOSS_MODEL_H
#define GBN_TRANSPORT_LOSS_MODEL_H

#include "config_info.h"
#include "itime.h"
#include "random_trials.h"

#include <string>

#include <stdint.h>

namespace gbn
{

  /// \brief A packet loss injector combining uniform random loss with a
  /// periodic burst loss window.
  ///
  /// For each outgoing packet the model decides whether the packet is
  /// delivered or silently dropped.  Two independent mechanisms compose:
  ///
  /// - Burst loss: if the burst interval and duration are set, and the
  ///   current time in milliseconds modulo the burst interval is less than
  ///   the burst duration, the packet is dropped with the burst loss rate.
  /// - Random loss: the packet is dropped with the random loss rate.
  ///
  /// A packet is delivered only if neither mechanism drops it.  The default
  /// configuration, with all rates zero, delivers every packet.
  ///
  /// This class is not thread-safe.  The owning sender serializes access.
  class LossModel
  {

   public:

    /// \brief Constructor for an ideal network that never drops.
    ///
    /// The random number generator is seeded from the clock.
    LossModel();

    /// \brief Destructor.
    virtual ~LossModel();

    /// \brief Configure the model from the "Gbn.Loss." configuration keys.
    ///
    /// \param  ci  The configuration information.
    ///
    /// \return  True on success, false if a value is out of range.
    bool Initialize(const ConfigInfo& ci);

    /// \brief Configure the model.
    ///
    /// \param  random_rate        The uniform loss probability, in [0, 1].
    /// \param  burst_rate         The drop probability inside the burst
    ///                            window, in [0, 1].
    /// \param  burst_duration_ms  The length of the burst window.
    /// \param  burst_interval_ms  The burst period.  Zero disables bursts.
    ///
    /// \return  True on success, false if a value is out of range, in which
    ///          case the model is unchanged.
    bool Configure(double random_rate, double burst_rate,
                   uint32_t burst_duration_ms, uint32_t burst_interval_ms);

    /// \brief Seed the random number generator, for repeatable runs.
    ///
    /// \param  seed  The seed.
    void SetSeed(uint32_t seed);

    /// \brief Decide the fate of one packet at a given time.
    ///
    /// \param  now  The current monotonic time.
    ///
    /// \return  True if the packet is to be delivered, false if dropped.
    bool Allow(const Time& now);

    /// \brief Decide the fate of one packet now.
    ///
    /// \return  True if the packet is to be delivered, false if dropped.
    inline bool Allow()
    {
      return Allow(Time::Now());
    }

    /// \brief Check if the model can ever drop a packet.
    ///
    /// \return  True if all drop probabilities are zero.
    inline bool IsIdeal() const
    {
      return ((random_rate_ <= 0.0) &&
              ((burst_rate_ <= 0.0) || (burst_interval_ms_ == 0) ||
               (burst_duration_ms_ == 0)));
    }

    /// \brief Get a string representation of the configuration.
    ///
    /// \return  The string representation.
    std::string ToString() const;

    inline double random_rate() const
    {
      return random_rate_;
    }

    inline double burst_rate() const
    {
      return burst_rate_;
    }

   private:

    /// \brief Copy constructor.
    LossModel(const LossModel& other);

    /// \brief Copy operator.
    LossModel& operator=(const LossModel& other);

    /// The uniform loss probability.
    double        random_rate_;

    /// The drop probability inside the burst window.
    double        burst_rate_;

    /// The burst window length, in milliseconds.
    uint32_t      burst_duration_ms_;

    /// The burst period, in milliseconds.
    uint32_t      burst_interval_ms_;

    /// The source of drop decisions.
    RandomTrials  trials_;

  }; // end class LossModel

} // namespace gbn

#endif // GBN_TRANSPORT_LOSS_MODEL_H
