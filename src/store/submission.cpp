#include "store/submission.hpp"

namespace grader::store {

bool submission::is_assigned() const {
    return assigned_runner >= 0;
}

}  // namespace grader::store
