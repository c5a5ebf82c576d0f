#include "store/job_store.hpp"

namespace grader::store {

job_store::~job_store() {}

}  // namespace grader::store
