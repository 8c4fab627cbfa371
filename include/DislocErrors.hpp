#ifndef DISLOC_ERRORS_HPP
#define DISLOC_ERRORS_HPP

#include <petscsys.h>

#include <stdexcept>
#include <string>

namespace DislocCore {

/**
 * @brief Root of the DislocCore exception hierarchy
 */
class DislocCoreError : public std::runtime_error {
public:
    explicit DislocCoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Stiffness tensor is not symmetric positive definite, or the Stroh
 * eigenproblem is degenerate for the requested orientation.
 *
 * Fatal for the construction that raised it; retrying with the same input
 * fails the same way.
 */
class IllConditionedElasticityError : public DislocCoreError {
public:
    explicit IllConditionedElasticityError(const std::string& what) : DislocCoreError(what) {}
};

/**
 * @brief Field query at the dislocation line, where displacement and stress
 * are singular. Perturbing the query point is a valid recovery.
 */
class SingularFieldError : public DislocCoreError {
public:
    explicit SingularFieldError(const std::string& what) : DislocCoreError(what) {}
};

/**
 * @brief Gamma-surface lookup outside the sampled domain with wrapping disabled
 */
class OutOfDomainError : public DislocCoreError {
public:
    explicit OutOfDomainError(const std::string& what) : DislocCoreError(what) {}
};

/**
 * @brief SDVPN relaxation could not reduce the energy before the step size
 * fell below its floor
 */
class DivergedError : public DislocCoreError {
public:
    DivergedError(const std::string& what, int iteration)
        : DislocCoreError(what), iteration_(iteration) {}

    int iteration() const { return iteration_; }

private:
    int iteration_;
};

} // namespace DislocCore

// Converts a failing PETSc call made outside a PetscErrorCode function into an exception
#define DISLOCCORE_CHECK_PETSC(call)                                                   \
    do {                                                                               \
        PetscErrorCode disloccore_ierr_ = (call);                                      \
        if (disloccore_ierr_ != 0) {                                                   \
            throw std::runtime_error(std::string("PETSc call failed: ") + #call +      \
                                     " (error " + std::to_string(disloccore_ierr_) +   \
                                     ")");                                             \
        }                                                                              \
    } while (0)

#endif // DISLOC_ERRORS_HPP
