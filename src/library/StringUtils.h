/**
 * \file StringUtils.h
 *
 * \brief String utilities for option values and data file lines.
 *
 * Functions follow lowercase with underscores style, locale aware.
 *
 * \version 1.0
 */

#ifndef STRINGUTILS_H
#define STRINGUTILS_H

#include <string>
#include <cctype>
#include <vector>
#include <locale>
#include <algorithm>
#include <iterator>
#include <sstream>
#include <iomanip>

namespace featrelief
{
  // Predicate class to test if a character is of a given class under a
  // locale. For example: is_classified<std::ctype_base::space>() tests for
  // whitespace.
  template <std::ctype_base::mask Type, class charT = char>
  class is_classified
  {
  public:
    is_classified(const std::locale &loc = std::locale())
    : m_ctype(&std::use_facet<std::ctype<charT> >(loc)) {
    }
    bool operator()(charT c) const {
      return m_ctype->is(Type, c);
    }
  private:
    const std::ctype<charT>* m_ctype;
  };

  // Negation of is_classified.
  template <std::ctype_base::mask Type, class charT = char>
  class is_not_classified
  {
  public:
    is_not_classified(const std::locale &loc = std::locale())
    : m_pred(loc) {
    }
    bool operator()(charT c) const {
      return !m_pred(c);
    }
  private:
    is_classified<Type, charT> m_pred;
  };

  // remove leading and trailing whitespace
  template <typename stringT>
  stringT trim(const stringT &s, const std::locale &loc = std::locale()) {
    typedef typename stringT::value_type charT;
    typename stringT::const_iterator b =
            std::find_if(s.begin(), s.end(),
                         is_not_classified<std::ctype_base::space, charT>(loc));
    if(b == s.end())
      return stringT();
    typename stringT::const_reverse_iterator e =
            std::find_if(s.rbegin(), s.rend(),
                         is_not_classified<std::ctype_base::space, charT>(loc));
    return stringT(b, e.base());
  }

  inline std::string trim(const char *s,
                          const std::locale &loc = std::locale()) {
    return trim(std::string(s), loc);
  }

  // perl-like split with predicate
  // (pred is a unary predicate on stringT::value_type deciding whether a
  // character is a delimiter; empty fields are dropped)
  template <typename Container, typename stringT, typename Pred>
  void split_if(Container &cont, const stringT &s, const Pred &pred) {
    typename stringT::const_iterator i, j;
    for(i = s.begin(); i != s.end(); i = j + 1) {
      j = std::find_if(i, s.end(), pred);
      if(j == s.end()) {
        cont.push_back(s.substr(i - s.begin()));
        break;
      }
      if(j != i)
        cont.push_back(s.substr(i - s.begin(), j - i));
    }
  }

  // perl-like split on whitespace
  template <typename Container, typename stringT>
  inline void split(Container &cont, const stringT &s,
                    const std::locale &loc = std::locale()) {
    split_if(cont, s, is_classified<std::ctype_base::space,
             typename stringT::value_type>(loc));
  }

  // perl-like join
  template <typename It, typename stringT>
  stringT join(const It &begin, const It &end, const stringT &delim) {
    stringT ret;
    for(It i = begin; i != end; ++i) {
      if(i != begin)
        ret += delim;
      ret += *i;
    }
    return ret;
  }

  // return uppercased copy of string
  template <typename stringT>
  stringT to_upper(const stringT &str,
                   const std::locale &loc = std::locale()) {
    typedef typename stringT::value_type charT;
    const std::ctype<charT>& ct = std::use_facet<std::ctype<charT> >(loc);
    stringT s = str;
    for(typename stringT::iterator it = s.begin(); it != s.end(); ++it) {
      *it = ct.toupper(*it);
    }
    return s;
  }

  // return lowercased copy of string
  template <typename stringT>
  stringT to_lower(const stringT &str,
                   const std::locale &loc = std::locale()) {
    typedef typename stringT::value_type charT;
    const std::ctype<charT>& ct = std::use_facet<std::ctype<charT> >(loc);
    stringT s = str;
    for(typename stringT::iterator it = s.begin(); it != s.end(); ++it) {
      *it = ct.tolower(*it);
    }
    return s;
  }

  // Name for an unnamed column: F0001, F0002, ...
  inline std::string featureNameForIndex(unsigned int index,
                                         unsigned int width = 4) {
    std::ostringstream ss;
    ss << "F" << std::setw(width) << std::setfill('0') << (index + 1);
    return ss.str();
  }
}

#endif
