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

/// \brief Seeded Bernoulli trials for the loss model.

#ifndef GBN_COMMON_RANDOM_TRIALS_H
#define GBN_COMMON_RANDOM_TRIALS_H

#include <cstdlib>

#include <stdint.h>

namespace gbn
{

  /// \brief A reproducible source of yes/no outcomes.
  ///
  /// Each call to Succeeds() consumes one value from a private random_r(3)
  /// stream, so two objects given the same seed report the same sequence of
  /// outcomes for the same sequence of probabilities.  Not safe for
  /// concurrent use.
  class RandomTrials
  {

   public:

    /// \brief Constructor.  The seed is taken from the clock.
    RandomTrials();

    /// \brief Constructor.
    ///
    /// \param  seed  The seed.
    explicit RandomTrials(uint32_t seed);

    /// \brief Destructor.
    virtual ~RandomTrials();

    /// \brief Restart the outcome sequence from a seed.
    ///
    /// \param  seed  The seed.
    ///
    /// \return  True on success.
    bool Reseed(uint32_t seed);

    /// \brief Run one trial.
    ///
    /// A probability at or below 0 never succeeds and one at or above 1
    /// always does.  Neither consumes a value.
    ///
    /// \param  probability  The chance of success.
    ///
    /// \return  True if the trial succeeds.
    bool Succeeds(double probability);

    inline uint32_t seed() const
    {
      return seed_;
    }

   private:

    /// \brief Copy constructor.
    RandomTrials(const RandomTrials& other);

    /// \brief Copy operator.
    RandomTrials& operator=(const RandomTrials& other);

    /// \brief Get the next value, uniform over [0, 1).
    ///
    /// \param  value  Set to the value on success.
    ///
    /// \return  False if random_r(3) fails.
    bool NextUnit(double& value);

    /// The random_r(3) state buffer.
    char                state_buf_[32];

    /// The random_r(3) state.
    struct random_data  state_;

    /// The last seed applied.
    uint32_t            seed_;

  }; // end class RandomTrials

} // namespace gbn

#endif // GBN_COMMON_RANDOM_TRIALS_H
