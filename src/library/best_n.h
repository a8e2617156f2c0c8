/**
 * \file best_n.h
 *
 * \brief Find the best n keeping original order for ties - stable sort.
 *
 * \version 1.0
 */

#ifndef BEST_N_H
#define BEST_N_H

#include <vector>
#include <algorithm>
#include <iterator>
#include <boost/pointee.hpp>
#include <boost/type_traits/remove_const.hpp>

namespace featrelief
{

  /***************************************************************************//**
   * Get the best n values with ties keeping same original order.
   * The n values are written to out in no particular order; sort them
   * afterwards when the order matters.
   * \param [in] begin iterator of the beginning of a input container
   * \param [in] end iterator of the end of a input container
   * \param [out] out iterator of the beginning of a output container
   * \param [in] n best n value
   * \param [in] comp compare functor
   ******************************************************************************/
  template <typename InputIt, typename OutputIt, typename Comp>
  void best_n(InputIt begin, InputIt end, OutputIt out, size_t n, Comp comp) {
    typedef typename boost::remove_const<
            typename boost::pointee<InputIt>::type>::type T;
    typename std::vector<T> best;
    int maxindex = 0;

    if(!n) {
      return;
    }
    best.reserve(n);

    for(InputIt it = begin; it != end; ++it) {
      if(best.size() < n) {
        best.push_back(*it);

        if(best.size() == n)
          maxindex = std::distance(best.begin(),
                                   std::max_element(best.begin(), best.end(), comp));
        else
          ++maxindex;

        continue;
      }

      if(comp(*it, best[maxindex])) {
        best[maxindex] = *it;
        maxindex = std::distance(best.begin(),
                                 std::max_element(best.begin(), best.end(), comp));
      }
    }

    for(typename std::vector<T>::iterator i = best.begin();
        i != best.end(); ++i)
      *out++ = *i;
  }

}

#endif
