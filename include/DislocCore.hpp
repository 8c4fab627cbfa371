#ifndef DISLOCCORE_HPP
#define DISLOCCORE_HPP

/**
 * @file DislocCore.hpp
 * @brief Public entry points of the DislocCore library
 *
 * Straight-dislocation elasticity:
 *   - ElasticConstants            6x6 Voigt stiffness
 *   - DislocationGeometry         Burgers vector and (m, n, xi) frame
 *   - solveStroh                  Anisotropic sextic eigen solution
 *   - solveVolterraDislocation    Isotropic closed form or Stroh field
 *   - VolterraDislocation         Displacement, stress and K tensor
 *
 * Core structure:
 *   - GammaSurface                Interpolated misfit energy
 *   - ElasticKernel               Discretized elastic interaction
 *   - SDVPN / solveSDVPN          Semi-discrete variational Peierls-Nabarro
 *   - pnArctanDisregistry         Classic arctan starting profile
 */

#include "DislocTypes.hpp"
#include "DislocErrors.hpp"
#include "ElasticConstants.hpp"
#include "DislocationGeometry.hpp"
#include "Stroh.hpp"
#include "IsotropicVolterraDislocation.hpp"
#include "VolterraDislocation.hpp"
#include "GammaSurface.hpp"
#include "DisregistryProfile.hpp"
#include "ElasticKernel.hpp"
#include "SDVPN.hpp"
#include "UnitSystem.hpp"

#endif // DISLOCCORE_HPP
