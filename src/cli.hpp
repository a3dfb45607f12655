/*
    Copyright (C) 2020
    Author: Corbin Quick <qcorbin@hsph.harvard.edu>

    This file is a part of PAIRMETA.

    PAIRMETA is distributed "AS IS" in the hope that it will be
    useful, but WITHOUT ANY WARRANTY; without even the implied
    warranty of MERCHANTABILITY, NON-INFRINGEMENT, or FITNESS
    FOR A PARTICULAR PURPOSE.

    The above copyright notice and disclaimer of warranty must
    be included in all copies or substantial portions of PAIRMETA.
*/

#ifndef PAIRMETA_CLI_HPP
#define PAIRMETA_CLI_HPP

#include <stdexcept>
#include <algorithm>
#include <functional>
#include <vector>
#include <cstdlib>
#include <csignal>

#if defined(_OPENMP)
#include <omp.h>
#endif

#include "args.hxx"
#include "setOptions.hpp"
#include "errors.hpp"
#include "htsWrappers.hpp"
#include "mapID.hpp"
#include "diseaseMap.hpp"
#include "suffStats.hpp"
#include "metaAnalysis.hpp"
#include "statStore.hpp"
#include "aggregator.hpp"
#include "rankView.hpp"
#include "readInputs.hpp"
#include "miscUtils.hpp"
#include "mathStats.hpp"

// ------------------------------------
//  Running modes
// ------------------------------------

int update(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs);
int top(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs);
int review(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs);
int combine(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs);
int verify(const std::string &progname, std::vector<std::string>::const_iterator beginargs, std::vector<std::string>::const_iterator endargs);

using mode_fun = std::function<int(const std::string &, std::vector<std::string>::const_iterator, std::vector<std::string>::const_iterator)>;

#endif
