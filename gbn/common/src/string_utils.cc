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

#include "string_utils.h"
#include "log.h"
#include "unused.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <strings.h>

using ::gbn::StringUtils;
using ::std::string;
using ::std::vector;

namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "StringUtils";

  /// The whitespace characters removed by Trim().
  const char*  kWhitespace        = " \t\r\n";
}


//============================================================================
void StringUtils::Tokenize(const string& str, const char* delim,
                           vector<string>& tokens)
{
  tokens.clear();

  size_t  start = str.find_first_not_of(delim);

  while (start != string::npos)
  {
    size_t  end = str.find_first_of(delim, start);

    if (end == string::npos)
    {
      tokens.push_back(str.substr(start));
      break;
    }

    tokens.push_back(str.substr(start, (end - start)));
    start = str.find_first_not_of(delim, end);
  }
}

//============================================================================
string StringUtils::Trim(const string& str)
{
  size_t  start = str.find_first_not_of(kWhitespace);

  if (start == string::npos)
  {
    return "";
  }

  size_t  end = str.find_last_not_of(kWhitespace);

  return str.substr(start, (end - start + 1));
}

//============================================================================
bool StringUtils::GetBool(const string& str, const bool default_value)
{
  bool  rv = default_value;

  //
  // Use strncasecmp() to do a case-insensitive comparisons on "true" and
  // "false". Also permits the value "0" to be used to represent false or the
  // value "1" to be used to represent true.
  //

  if (::strncasecmp(str.c_str(), "true", 4) == 0)
  {
    rv = true;
  }
  else if (::strncasecmp(str.c_str(), "false", 5) == 0)
  {
    rv = false;
  }
  else if (::strncmp(str.c_str(), "0", 1) == 0)
  {
    rv = false;
  }
  else if (::strncmp(str.c_str(), "1", 1) == 0)
  {
    rv = true;
  }

  return rv;
}

//============================================================================
int StringUtils::GetInt(const string& str, const int default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // Clear errno before the call, per strtol(3).
  errno = 0;

  long  val = ::strtol(str_ptr, &end_ptr, 10);

  // Check for overflow, underflow, and any other conversion error.
  if ((errno != 0) || (val > INT_MAX) || (val < INT_MIN))
  {
    LogE(kClassName, __func__, "Error converting string %s to int: %s\n",
         str_ptr, strerror((errno != 0) ? errno : ERANGE));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to int.\n",
         str_ptr);
    return default_value;
  }

  return static_cast<int>(val);
}

//============================================================================
unsigned int StringUtils::GetUint(const string& str,
                                  const unsigned int default_value)
{
  uint64_t  val = GetUint64(str, UINT64_MAX);

  if ((val == UINT64_MAX) || (val > UINT_MAX))
  {
    return default_value;
  }

  return static_cast<unsigned int>(val);
}

//============================================================================
uint64_t StringUtils::GetUint64(const string& str,
                                const uint64_t default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // strtoull(3) silently negates negative input.
  if (str.find('-') != string::npos)
  {
    LogE(kClassName, __func__, "Negative value %s for unsigned integer.\n",
         str_ptr);
    return default_value;
  }

  // Clear errno before the call, per strtoull(3).
  errno = 0;

  unsigned long long  val = ::strtoull(str_ptr, &end_ptr, 10);

  // Check for overflow, underflow, and any other conversion error.
  if (errno != 0)
  {
    LogE(kClassName, __func__, "Error converting string %s to uint64_t: %s\n",
         str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to uint64_t.\n",
         str_ptr);
    return default_value;
  }

  return static_cast<uint64_t>(val);
}

//============================================================================
float StringUtils::GetFloat(const string& str, const float default_value)
{
  double  val = GetDouble(str, DBL_MAX);

  if ((val == DBL_MAX) || (fabs(val) > FLT_MAX))
  {
    return default_value;
  }

  return static_cast<float>(val);
}

//============================================================================
double StringUtils::GetDouble(const string& str, const double default_value)
{
  char*        end_ptr = NULL;
  const char*  str_ptr = str.c_str();

  // Clear errno before the call, per strtod(3).
  errno = 0;

  double  val = ::strtod(str_ptr, &end_ptr);

  // Check for overflow, underflow, and any other conversion error.
  if (((errno == ERANGE) && ((val == HUGE_VAL) || (val == -HUGE_VAL)))
      || ((errno != 0) && (val == 0.0)))
  {
    LogE(kClassName, __func__, "Error converting string %s to double: %s\n",
         str_ptr, strerror(errno));
    return default_value;
  }

  // Check for no conversion.
  if (end_ptr == str_ptr)
  {
    LogE(kClassName, __func__, "Error converting string %s to double.\n",
         str_ptr);
    return default_value;
  }

  return val;
}

//============================================================================
string StringUtils::ToString(int value)
{
  char  buf[16];

  if (snprintf(buf, sizeof(buf), "%d", value) <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %d to a string.\n",
         value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(uint32_t value)
{
  char  buf[16];

  if (snprintf(buf, sizeof(buf), "%" PRIu32, value) <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %" PRIu32
         " to a string.\n", value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(uint64_t value)
{
  char  buf[32];

  if (snprintf(buf, sizeof(buf), "%" PRIu64, value) <= 0)
  {
    LogE(kClassName, __func__, "Error converting integer %" PRIu64
         " to a string.\n", value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::ToString(double value)
{
  char  buf[32];

  if (snprintf(buf, sizeof(buf), "%.06f", value) <= 0)
  {
    LogE(kClassName, __func__, "Error converting double %f to a string.\n",
         value);
    buf[0] = '?';
    buf[1] = '\0';
  }

  return buf;
}

//============================================================================
string StringUtils::FormatString(int size, const char* format, ...)
{
  if ((size < 2) || (format == NULL))
  {
    return "";
  }

  vector<char>  format_str(static_cast<size_t>(size), '\0');
  va_list       vargs;

  va_start(vargs, format);
  if (vsnprintf(&format_str[0], size, format, vargs) >= size)
  {
    LogW(kClassName, __func__, "String was truncated during formatting.\n");
  }
  va_end(vargs);

  return string(&format_str[0]);
}
