#include "errors.hpp"

namespace {

std::string describe(std::exception_ptr cause) {
    try {
        std::rethrow_exception(cause);
    }
    catch (const std::exception& ex) {
        return ex.what();
    }
    catch (...) {
        return "unknown error";
    }
}

}

InvalidTag::InvalidTag(const std::string& tag, const std::string& reason)
    : InvalidInput("Invalid ETag '" + tag + "': " + reason) {  }

IOError::IOError(const std::string& what, int err)
    : std::ios_base::failure(what, std::error_code(err, std::generic_category())) {  }

WorkerError::WorkerError(unsigned int worker, std::exception_ptr cause)
    : std::runtime_error("Worker " + std::to_string(worker) + " failed: " + describe(cause)),
      worker_index(worker), cause_ptr(cause) {  }

void WorkerError::rethrowCause(void) const {
    std::rethrow_exception(this->cause_ptr);
}
