/*
 * error.h
 *
 *  Copyright (C) 2013 Diamond Light Source
 *
 *  This code is distributed under the BSD license, a copy of which is
 *  included in the root directory of this package.
 */
#ifndef CREDO_ERROR_H
#define CREDO_ERROR_H

#include <sstream>
#include <stdexcept>
#include <string>

namespace credo {

  /**
   * The base error class. Internal errors carry the file and line where they
   * were raised.
   */
  class error : public std::runtime_error {
  public:
    explicit error(const std::string &msg) : std::runtime_error(msg) {}

    error(const char *file, long line, const std::string &msg, bool internal = true)
        : std::runtime_error(format(file, line, msg, internal)) {}

  protected:
    static std::string format(const char *file,
                              long line,
                              const std::string &msg,
                              bool internal) {
      std::ostringstream o;
      o << "credo";
      if (internal) {
        o << " Internal";
      }
      o << " Error: " << file << "(" << line << ")";
      if (!msg.empty()) {
        o << ": " << msg;
      }
      return o.str();
    }
  };

  /**
   * Raised for inputs that cannot be processed: mismatched array shapes,
   * malformed bin edges or an unusable geometry.
   */
  class input_error : public error {
  public:
    explicit input_error(const std::string &msg) : error(msg) {}

    input_error(const char *file, long line, const std::string &msg)
        : error(file, line, msg, false) {}
  };

  /**
   * Raised for an unknown enumerated mode.
   */
  class configuration_error : public error {
  public:
    explicit configuration_error(const std::string &msg) : error(msg) {}

    configuration_error(const char *file, long line, const std::string &msg)
        : error(file, line, msg, false) {}
  };

}  // namespace credo

#define CREDO_ERROR(msg) throw credo::error(__FILE__, __LINE__, msg)

#define CREDO_ASSERT(assertion)                          \
  if (!(assertion)) {                                    \
    throw credo::error(                                  \
      __FILE__, __LINE__, "CREDO_ASSERT(" #assertion ") failure."); \
  }

#define CREDO_INPUT_ASSERT(assertion, msg)                   \
  if (!(assertion)) {                                        \
    throw credo::input_error(__FILE__, __LINE__, msg);       \
  }

#define CREDO_CONFIGURATION_ERROR(msg) \
  throw credo::configuration_error(__FILE__, __LINE__, msg)

#endif /* CREDO_ERROR_H */
