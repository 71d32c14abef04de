#pragma once

#include <exception>
#include <string>

#include "internal/model/task_record.hpp"

namespace finq::util {

// Demangled dynamic type of e, e.g. "std::invalid_argument".
std::string TypeName(const std::exception& e);

/*
  Turns an in-flight exception into a TaskError.

  traceback lists the exception followed by every cause attached
  with std::throw_with_nested, outermost first.
*/
model::TaskError DescribeException(std::exception_ptr error);

// Traceback for an error reported without an exception: one "raised" frame.
std::string SingleFrameTraceback(const std::string& type, const std::string& message);

} // namespace finq::util
