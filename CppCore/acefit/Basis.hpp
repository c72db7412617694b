#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief CRTP template for concrete basis sets.
 *
 * Concrete bases implement one flat kernel, @c evaluateImpl, and inherit the
 * typed @c BasisEvaluator queries from @c Basis<Derived>.  The template
 * handles output sizing, request validation, evaluation counting and, when
 * built with @c ACEFIT_HAS_CACHE, the optional evaluation cache.
 */

// clang-format off
#include <cstddef>
#include <vector>
// clang-format on

#ifdef ACEFIT_HAS_CACHE
#define XXH_INLINE_ALL
#include "acefit/EvaluationCache.hpp"
#include <xxhash.h>
#endif

#include "acefit/EvalHelpers.hpp"
#include "acefit/EvalStructs.hpp"
#include "acefit/Evaluators.hpp"
#include "acefit/basis_types.hpp"

namespace acefit {

/**
 * @class Basis
 * @brief Template base for basis implementations.
 *
 * Uses the Curiously Recurring Template Pattern to call the derived
 * @c evaluateImpl without a second level of virtual dispatch.
 */
template <typename Derived>
class Basis : public BasisEvaluator, public registry<Derived> {
public:
  /**
   * @brief Constructor.
   * @param inp_type The basis family.
   * @param nbasis   Number of basis functions.
   */
  Basis(BasisType inp_type, size_t nbasis) : m_type(inp_type), m_length(nbasis) {}

  size_t length() const override { return m_length; }

  /**
   * @brief Fetches the basis family.
   * @return The basis type.
   */
  [[nodiscard]] BasisType get_type() const { return m_type; }

  std::vector<double> energy(const Configuration &config) const override {
    return evaluate(config, EvalKind::Energy, 0);
  }

  std::vector<AtomMatrix> forces(const Configuration &config) const override {
    const size_t nAtoms = config.size();
    auto flat = evaluate(config, EvalKind::Forces, 0);
    std::vector<AtomMatrix> result;
    result.reserve(m_length);
    for (size_t k = 0; k < m_length; ++k) {
      result.push_back(
          AtomMatrix::FromFlat(nAtoms, 3, flat.data() + k * nAtoms * 3));
    }
    return result;
  }

  std::vector<Tensor33> virial(const Configuration &config) const override {
    auto flat = evaluate(config, EvalKind::Virial, 0);
    std::vector<Tensor33> result(m_length);
    for (size_t k = 0; k < m_length; ++k) {
      for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
          result[k][i][j] = flat[k * 9 + i * 3 + j];
        }
      }
    }
    return result;
  }

  std::vector<double> site_energy(const Configuration &config,
                                  size_t atom) const override {
    return evaluate(config, EvalKind::SiteEnergy, atom);
  }

#ifdef ACEFIT_HAS_CACHE
  /**
   * @brief Sets the evaluation cache.
   * @param c Pointer to an EvaluationCache, or @c nullptr to detach.
   * @return Void.
   */
  void set_cache(cache::EvaluationCache *c) { _cache = c; }
#endif

  /**
   * @brief Abstract hook for the actual kernel.
   * @param in  Structure describing the configuration and the request.
   * @param out Pointer to the zero-initialized flat results.
   * @return Void.
   */
  virtual void evaluateImpl(const EvalInput &in, EvalOut *out) const = 0;

  /**
   * @brief Hash of the basis hyperparameters.
   *
   * Two instances with equal fingerprints must produce identical
   * evaluations; the cache relies on it.
   *
   * @return A hash of everything that defines the basis.
   */
  virtual size_t fingerprint() const = 0;

protected:
  BasisType m_type; //!< The basis family.
  size_t m_length;  //!< Number of basis functions.

private:
  /**
   * @brief Runs one flat evaluation.
   *
   * # Caching Logic
   * If @c ACEFIT_HAS_CACHE is defined and a cache is attached:
   * 1. Generates a @c XXH3_64bits hash of positions, species, cell, basis
   *    type and fingerprint, request kind and atom index.
   * 2. Returns the stored values on a hit.
   * 3. Otherwise evaluates and stores the result.
   *
   * @param config The configuration.
   * @param kind   The requested quantity.
   * @param atom   Atom index for site energies.
   * @return The flat results.
   */
  std::vector<double> evaluate(const Configuration &config, EvalKind kind,
                               size_t atom) const {
    const size_t nAtoms = config.size();
    double flatBox[9];
    for (size_t i = 0; i < 3; ++i) {
      for (size_t j = 0; j < 3; ++j) {
        flatBox[i * 3 + j] = config.cell()[i][j];
      }
    }

    EvalInput in{.nAtoms = nAtoms,
                 .pos = config.positions().data(),
                 .atmnrs = config.species().data(),
                 .box = flatBox,
                 .kind = kind,
                 .atom = atom};
    checkInput(in);

    const size_t nvalues = evalOutSize(kind, m_length, nAtoms);
    std::vector<double> values(nvalues, 0.0);
    EvalOut out{.values = values.data(), .size = nvalues};

#ifdef ACEFIT_HAS_CACHE
    // Hashing
    size_t hash_val = 0;
    hash_val ^= XXH3_64bits(in.pos, nAtoms * 3 * sizeof(double));
    hash_val ^= XXH3_64bits(in.atmnrs, nAtoms * sizeof(int)) * 3;
    hash_val ^= XXH3_64bits(in.box, 9 * sizeof(double)) * 5;
    const size_t request[4] = {static_cast<size_t>(m_type), fingerprint(),
                               static_cast<size_t>(kind), atom};
    hash_val ^= XXH3_64bits(request, sizeof(request)) * 7;

    cache::KeyHash key(hash_val);

    // Cache Read
    if (_cache) {
      auto hit = _cache->find(key);
      if (hit) {
        _cache->deserialize_hit(*hit, values);
        return values;
      }
    }

    // Computation
    static_cast<const Derived *>(this)->evaluateImpl(in, &out);
    registry<Derived>::incrementEvaluations();

    // Cache Write
    if (_cache) {
      _cache->add_serialized(key, values);
    }
#else
    static_cast<const Derived *>(this)->evaluateImpl(in, &out);
    registry<Derived>::incrementEvaluations();
#endif

    return values;
  }

#ifdef ACEFIT_HAS_CACHE
  cache::EvaluationCache *_cache =
      nullptr; //!< Pointer to the optional evaluation cache.
#endif
};

} // namespace acefit
