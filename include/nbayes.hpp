// nbayes.hpp is the header file that you need to include in your code. It wraps
// all the internal nbayes header files into one for simpler inclusion.

#ifndef NBAYES_NBAYES_HPP_
#define NBAYES_NBAYES_HPP_

#include "common.hpp"
#include "errors.hpp"
#include "tokenizer.hpp"
#include "vocab.hpp"
#include "naive_bayes.hpp"
#include "confusion_matrix.hpp"
#include "dataset.hpp"
#include "io.hpp"

#endif
