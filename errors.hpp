#ifndef __ERRORS_H__
#define __ERRORS_H__

#include <exception>
#include <ios>
#include <stdexcept>
#include <string>
#include <system_error>

class InvalidInput : public std::invalid_argument {
  public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {  }
};

class InvalidTag : public InvalidInput {
  public:
    InvalidTag(const std::string& tag, const std::string& reason);
};

class IOError : public std::ios_base::failure {
  public:
    IOError(const std::string& what, int err);
};

// Fewer bytes on disk than the plan expects (file changed underneath us)
class RangeError : public std::runtime_error {
  public:
    explicit RangeError(const std::string& what) : std::runtime_error(what) {  }
};

class WorkerError : public std::runtime_error {
  public:
    WorkerError(unsigned int worker, std::exception_ptr cause);
    unsigned int worker(void) const { return this->worker_index; }
    std::exception_ptr cause(void) const { return this->cause_ptr; }
    [[noreturn]] void rethrowCause(void) const;
  private:
    unsigned int worker_index;
    std::exception_ptr cause_ptr;
};

#endif  //__ERRORS_H__
