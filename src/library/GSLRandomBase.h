#ifndef GSL_RANDOM_BASE_H
#define GSL_RANDOM_BASE_H

//
// GNU Scientific Library includes
//
#include <gsl/gsl_rng.h>

/**
   A base class for GNU Scientific Library (GSL) random number
   functions.  The setup, seeding and clean-up is the same for all GSL
   random number functions: the generator state is allocated and seeded in
   the constructor and released in the destructor.

   A class that provides access to one GSL random number function derives
   from this class and implements nextRandVal(), for example with
   gsl_ran_flat() for a flat distribution or gsl_rng_uniform_int() for
   uniformly drawn indices.

   gsl_rng_env_setup() honours GSL_RNG_TYPE and defaults to MT19937, so a
   fixed seed reproduces the same sequence from run to run.  Instance
   sampling in ReliefF and the synthetic data sets in the tests rely on
   that.
 */

class GSLRandomBase {
private:
    GSLRandomBase(const GSLRandomBase &rhs);
    GSLRandomBase& operator=(const GSLRandomBase &rhs);

protected:

    gsl_rng *state() {
        return rStatePtr_;
    }
    gsl_rng *rStatePtr_;

public:

    explicit GSLRandomBase(unsigned long int seedVal) {
        const gsl_rng_type *T;

        T = gsl_rng_env_setup();

        // Allocate a random number state structure
        rStatePtr_ = gsl_rng_alloc(T);

        // set the seed
        gsl_rng_set(rStatePtr_, seedVal);
    } // GSLRandomBase constructor

    virtual ~GSLRandomBase() {
        gsl_rng_free(rStatePtr_);
    } // GSLRandomBase destructor

    virtual double nextRandVal() = 0;

};

#endif
