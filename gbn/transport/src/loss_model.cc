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

/// \brief The GbnStream loss model source file.

#include "loss_model.h"

#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <inttypes.h>

using ::gbn::ConfigInfo;
using ::gbn::LossModel;
using ::gbn::StringUtils;
using ::gbn::Time;
using ::std::string;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "LossModel";
}

//============================================================================
LossModel::LossModel()
    : random_rate_(0.0),
      burst_rate_(0.0),
      burst_duration_ms_(0),
      burst_interval_ms_(0),
      trials_()
{
}

//============================================================================
LossModel::~LossModel()
{
}

//============================================================================
bool LossModel::Initialize(const ConfigInfo& ci)
{
  double    random_rate   = ci.GetDouble("Gbn.Loss.RandomRate", 0.0);
  double    burst_rate    = ci.GetDouble("Gbn.Loss.BurstRate", 0.0);
  uint32_t  burst_dur_ms  = ci.GetUint("Gbn.Loss.BurstDurationMs", 0);
  uint32_t  burst_int_ms  = ci.GetUint("Gbn.Loss.BurstIntervalMs", 0);
  uint32_t  seed          = ci.GetUint("Gbn.Loss.Seed", 0);

  if (!Configure(random_rate, burst_rate, burst_dur_ms, burst_int_ms))
  {
    return false;
  }

  if (seed != 0)
  {
    SetSeed(seed);
  }

  LogC(kClassName, __func__, "Gbn.Loss.RandomRate       : %f\n",
       random_rate_);
  LogC(kClassName, __func__, "Gbn.Loss.BurstRate        : %f\n",
       burst_rate_);
  LogC(kClassName, __func__, "Gbn.Loss.BurstDurationMs  : %" PRIu32 "\n",
       burst_duration_ms_);
  LogC(kClassName, __func__, "Gbn.Loss.BurstIntervalMs  : %" PRIu32 "\n",
       burst_interval_ms_);
  LogC(kClassName, __func__, "Gbn.Loss.Seed             : %" PRIu32 "\n",
       trials_.seed());

  return true;
}

//============================================================================
bool LossModel::Configure(double random_rate, double burst_rate,
                          uint32_t burst_duration_ms,
                          uint32_t burst_interval_ms)
{
  if ((random_rate < 0.0) || (random_rate > 1.0))
  {
    LogE(kClassName, __func__, "Invalid random loss rate %f.\n",
         random_rate);
    return false;
  }

  if ((burst_rate < 0.0) || (burst_rate > 1.0))
  {
    LogE(kClassName, __func__, "Invalid burst loss rate %f.\n", burst_rate);
    return false;
  }

  if ((burst_interval_ms > 0) && (burst_duration_ms > burst_interval_ms))
  {
    LogW(kClassName, __func__, "Burst duration %" PRIu32 " ms exceeds burst "
         "interval %" PRIu32 " ms, bursts are continuous.\n",
         burst_duration_ms, burst_interval_ms);
  }

  random_rate_       = random_rate;
  burst_rate_        = burst_rate;
  burst_duration_ms_ = burst_duration_ms;
  burst_interval_ms_ = burst_interval_ms;

  return true;
}

//============================================================================
void LossModel::SetSeed(uint32_t seed)
{
  if (!trials_.Reseed(seed))
  {
    LogW(kClassName, __func__, "Unable to seed the loss model with %" PRIu32
         ".\n", seed);
  }
}

//============================================================================
bool LossModel::Allow(const Time& now)
{
  // Burst loss.
  if ((burst_rate_ > 0.0) && (burst_interval_ms_ > 0))
  {
    int64_t  now_ms = now.GetTimeInMsec();
    int64_t  pos    = (now_ms % static_cast<int64_t>(burst_interval_ms_));

    if ((pos < static_cast<int64_t>(burst_duration_ms_)) &&
        trials_.Succeeds(burst_rate_))
    {
      LogD(kClassName, __func__, "Burst drop at %" PRId64 " ms.\n", now_ms);
      return false;
    }
  }

  // Random loss.
  if (trials_.Succeeds(random_rate_))
  {
    return false;
  }

  return true;
}

//============================================================================
string LossModel::ToString() const
{
  return StringUtils::FormatString(
    128, "random=%f burst=%f burst_duration=%" PRIu32 "ms burst_interval=%"
    PRIu32 "ms", random_rate_, burst_rate_, burst_duration_ms_,
    burst_interval_ms_);
}
