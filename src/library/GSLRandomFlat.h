#ifndef GSL_RANDOM_FLAT_H
#define GSL_RANDOM_FLAT_H

#include "GSLRandomBase.h"

#include <gsl/gsl_randist.h>

/**
  Random numbers in a flat, or uniform distribution

  The class constructor is given a seed and a lower and upper
  bound value for the uniform distribution.  The random numbers
  that result will be a uniform distribution in the range

<pre>
    lower <= randVal < upper
</pre>

 */

class GSLRandomFlat : public GSLRandomBase {
private:
    double lower_, upper_;

public:

    GSLRandomFlat(unsigned long int seedVal,
            double lower,
            double upper) :
    GSLRandomBase(seedVal),
    lower_(lower),
    upper_(upper) {
        ;
    }

    double nextRandVal() {
        return gsl_ran_flat(state(), lower_, upper_);
    }
};

/**
  Uniformly distributed integers in the range

<pre>
    0 <= randVal < n
</pre>

  Used to draw instance indices and discrete feature levels.
 */

class GSLRandomUniformInt : public GSLRandomBase {
private:
    unsigned long int n_;

public:

    GSLRandomUniformInt(unsigned long int seedVal,
            unsigned long int n) :
    GSLRandomBase(seedVal),
    n_(n) {
        ;
    }

    unsigned long int nextIndex() {
        return gsl_rng_uniform_int(state(), n_);
    }

    double nextRandVal() {
        return (double) nextIndex();
    }
};

#endif
