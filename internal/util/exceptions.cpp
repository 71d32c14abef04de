#include "exceptions.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <typeinfo>

namespace finq::util {
namespace {

std::string Demangle(const char* mangled) {
  int                                    status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status != 0 || !demangled) {
    return mangled;
  }
  return demangled.get();
}

void AppendChain(const std::exception& e, std::ostringstream& out, int depth) {
  out << "  " << (depth == 0 ? "raised " : "caused by ") << TypeName(e) << ": " << e.what() << "\n";
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    AppendChain(nested, out, depth + 1);
  } catch (...) {
    out << "  caused by unknown: non-standard exception\n";
  }
}

} // namespace

std::string TypeName(const std::exception& e) {
  auto name = Demangle(typeid(e).name());

  // std::throw_with_nested wraps the thrown type; report the user's type.
  static const std::string kNestedPrefix = "std::_Nested_exception<";
  if (name.rfind(kNestedPrefix, 0) == 0 && name.back() == '>') {
    return name.substr(kNestedPrefix.size(), name.size() - kNestedPrefix.size() - 1);
  }
  return name;
}

model::TaskError DescribeException(std::exception_ptr error) {
  model::TaskError out;
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    std::ostringstream trace;
    trace << "Traceback (outermost first):\n";
    AppendChain(e, trace, 0);

    out.error_type    = TypeName(e);
    out.error_message = e.what();
    out.traceback     = trace.str();
  } catch (...) {
    out.error_type    = "unknown";
    out.error_message = "non-standard exception";
    out.traceback     = SingleFrameTraceback(out.error_type, out.error_message);
  }
  return out;
}

std::string SingleFrameTraceback(const std::string& type, const std::string& message) {
  return "Traceback (outermost first):\n  raised " + type + ": " + message + "\n";
}

} // namespace finq::util
