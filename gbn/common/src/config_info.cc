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

#include "config_info.h"
#include "log.h"
#include "string_utils.h"
#include "unused.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <inttypes.h>
#include <libgen.h>


using ::gbn::ConfigInfo;
using ::gbn::StringUtils;
using ::std::map;
using ::std::string;
using ::std::vector;


namespace
{
  /// Class name for logging.
  const char*  UNUSED(kClassName) = "ConfigInfo";

  /// The maximum line length in a configuration file.
  const size_t  kMaxLineLen       = 1024;
}

//============================================================================
ConfigInfo::ConfigInfo()
    : config_items_()
{
}

//============================================================================
ConfigInfo::~ConfigInfo()
{
  //
  // Nothing to destroy.
  //
}

//============================================================================
void ConfigInfo::Add(const string& key, const string& value)
{
  if (key.empty() || value.empty())
  {
    LogE(kClassName, __func__, "Bad argument. Missing key or value.\n");
    return;
  }

  config_items_[key] = value;
}

//============================================================================
bool ConfigInfo::LoadFromFile(const string& file_name)
{
  if (file_name.empty())
  {
    LogE(kClassName, __func__, "No configuration file specified\n");
    return false;
  }

  FILE*  input_file = ::fopen(file_name.c_str(), "r");

  if (input_file == NULL)
  {
    LogE(kClassName, __func__, "Unable to open configuration file %s: %s\n",
         file_name.c_str(), strerror(errno));
    return false;
  }

  char  line[kMaxLineLen];

  while (::fgets(line, sizeof(line), input_file) != NULL)
  {
    string  entry = StringUtils::Trim(line);

    if (entry.empty() || (entry[0] == '#'))
    {
      //
      // Skip blank and comment lines.
      //
      continue;
    }

    size_t  sep   = entry.find_first_of(" \t");
    string  key   = entry.substr(0, sep);
    string  value;

    if (sep != string::npos)
    {
      value = StringUtils::Trim(entry.substr(sep));
    }

    if (value.empty())
    {
      LogW(kClassName, __func__, "Key %s in file %s has no value, "
           "ignoring.\n", key.c_str(), file_name.c_str());
      continue;
    }

    if (key != "include")
    {
      Add(key, value);
      continue;
    }

    //
    // If the file that we are including starts with a '/' character, we
    // will interpret it as an absolute path. Otherwise, it will be relative
    // to the location of the file that is currently being loaded.
    //

    string  file_to_load;

    if (value[0] == '/')
    {
      file_to_load = value;
    }
    else
    {
      vector<char>  file_name_dup(file_name.begin(), file_name.end());
      file_name_dup.push_back('\0');

      file_to_load.append(::dirname(&file_name_dup[0]));
      file_to_load.append("/");
      file_to_load.append(value);
    }

    if (!LoadFromFile(file_to_load))
    {
      LogE(kClassName, __func__, "Error loading included file %s.\n",
           file_to_load.c_str());
      ::fclose(input_file);
      return false;
    }
  }

  ::fclose(input_file);

  return true;
}

//============================================================================
string ConfigInfo::ToString() const
{
  string                               result;
  map<string, string>::const_iterator  it;

  result.append("\n");
  for (it  = config_items_.begin();
       it != config_items_.end();
       ++it)
  {
    result.append(it->first);
    result.append(" ");
    result.append(it->second);
    result.append("\n");
  }

  return result;
}

//============================================================================
string ConfigInfo::Get(const string& key,
                       const string& default_value,
                       bool log_customizations) const
{
  map<string, string>::const_iterator  it = config_items_.find(key);

  if (it == config_items_.end())
  {
    return default_value;
  }

  if (log_customizations &&
      !default_value.empty() &&
      (it->second.compare(default_value) != 0))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %s, default is %s.\n",
         key.c_str(), it->second.c_str(), default_value.c_str());
  }

  return it->second;
}

//============================================================================
bool ConfigInfo::GetBool(const string& key, const bool default_value,
                         bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  bool  to_return = StringUtils::GetBool(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %c, default is %c.\n",
         key.c_str(), (to_return ? 'T' : 'F'), (default_value ? 'T' : 'F'));
  }

  return to_return;
}

//============================================================================
int ConfigInfo::GetInt(const string& key, const int default_value,
                       bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  int  to_return = StringUtils::GetInt(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %d, default is %d.\n",
         key.c_str(), to_return, default_value);
  }

  return to_return;
}

//============================================================================
unsigned int ConfigInfo::GetUint(const string& key,
                                 const unsigned int default_value,
                                 bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  unsigned int  to_return = StringUtils::GetUint(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %u, default is %u.\n",
         key.c_str(), to_return, default_value);
  }

  return to_return;
}

//============================================================================
uint64_t ConfigInfo::GetUint64(const string& key,
                               const uint64_t default_value,
                               bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  uint64_t  to_return = StringUtils::GetUint64(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %" PRIu64
         ", default is %" PRIu64 ".\n",
         key.c_str(), to_return, default_value);
  }

  return to_return;
}

//============================================================================
float ConfigInfo::GetFloat(const string& key, const float default_value,
                           bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  float  to_return = StringUtils::GetFloat(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %f, default is %f.\n",
         key.c_str(), static_cast<double>(to_return),
         static_cast<double>(default_value));
  }

  return to_return;
}

//============================================================================
double ConfigInfo::GetDouble(const string& key,
                             const double default_value,
                             bool log_customizations) const
{
  const string  value = Get(key, "", false);

  if (value.empty())
  {
    return default_value;
  }

  double  to_return = StringUtils::GetDouble(value, default_value);

  if (log_customizations && (to_return != default_value))
  {
    LogC(kClassName, __func__,
         "CUSTOMIZATION Key %s mismatch: value is %f, default is %f.\n",
         key.c_str(), to_return, default_value);
  }

  return to_return;
}
