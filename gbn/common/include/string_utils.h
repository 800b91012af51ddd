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

///
/// Provides the GbnStream software with a collection of methods for
/// manipulating std::string objects.
///

#ifndef GBN_COMMON_STRING_UTILS_H
#define GBN_COMMON_STRING_UTILS_H

#include <string>
#include <vector>
#include <inttypes.h>

#include <cfloat>
#include <climits>

namespace gbn
{
  ///
  /// A class that provides a set of static utility methods that deal with
  /// strings. This class enables us to capture frequently used string
  /// manipulation routines in a common place.
  ///
  class StringUtils
  {
    public:

    /// \brief Tokenize a string into a vector of tokens.
    ///
    /// Empty tokens are not returned.
    ///
    /// \param  str     The string to tokenize.
    /// \param  delim   The characters to use as the delimiter between the
    ///                 tokens.
    /// \param  tokens  The vector in which to return the tokens.  It is
    ///                 cleared first.
    static void Tokenize(const std::string& str,
                         const char* delim,
                         std::vector<std::string>& tokens);

    /// \brief Remove leading and trailing whitespace from a string.
    ///
    /// \param  str  The string to trim.
    ///
    /// \return  The trimmed string.
    static std::string Trim(const std::string& str);

    /// \brief Convert the provided string to a boolean value.
    ///
    /// Valid boolean values can be specified as:
    /// - Case insensitive characters 'true' evaluate to true
    /// - '1' evaluates to true
    /// - Case insensitive characters 'false' evaluate to false
    /// - '0' evaluates to false
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default boolean value to return if there
    ///                        is a conversion error.
    ///
    /// \return  The boolean value for the provided string.
    static bool GetBool(const std::string& str,
                        const bool default_value = true);

    /// \brief Convert the provided string to an integer.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default integer value to return if there
    ///                        is a conversion error.
    ///
    /// \return  The integer value for the provided string.
    static int GetInt(const std::string& str,
                      const int default_value = INT_MAX);

    /// \brief Convert the provided string to an unsigned integer.
    ///
    /// Negative values are conversion errors.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default value to return if there is a
    ///                        conversion error.
    ///
    /// \return  The unsigned integer value for the provided string.
    static unsigned int GetUint(const std::string& str,
                                const unsigned int default_value = UINT_MAX);

    /// \brief Convert the provided string to a uint64_t integer.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default value to return if there is a
    ///                        conversion error.
    ///
    /// \return  The uint64_t value for the provided string.
    static uint64_t GetUint64(const std::string& str,
                              const uint64_t default_value = UINT64_MAX);

    /// \brief Convert the provided string to a float.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default value to return if there is a
    ///                        conversion error.
    ///
    /// \return  The float value for the provided string.
    static float GetFloat(const std::string& str,
                          const float default_value = FLT_MAX);

    /// \brief Convert the provided string to a double.
    ///
    /// \param  str            The string containing the value to be
    ///                        converted.
    /// \param  default_value  The default value to return if there is a
    ///                        conversion error.
    ///
    /// \return  The double value for the provided string.
    static double GetDouble(const std::string& str,
                            const double default_value = DBL_MAX);

    /// \brief Convert the provided integer value into a string.
    static std::string ToString(int value);

    /// \brief Convert the provided uint32_t value into a string.
    static std::string ToString(uint32_t value);

    /// \brief Convert the provided uint64_t value into a string.
    static std::string ToString(uint64_t value);

    /// \brief Convert the provided double value into a string.
    static std::string ToString(double value);

    /// \brief Create a string with content derived from a 'printf' style
    /// format.
    ///
    /// \param  size    The maximum length of the created string, in bytes.
    /// \param  format  The formatting string, using 'printf' conventions.
    /// \param  ...     Additional arguments, one for each format field.
    ///
    /// \return  The formatted output as a string.
    static std::string FormatString(int size, const char* format, ...)
      __attribute__ ((format (printf, 2, 3)));

  }; // end class StringUtils

} // namespace gbn

#endif // GBN_COMMON_STRING_UTILS_H
