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
#ifndef PAIRMETA_MAIN
#define PAIRMETA_MAIN

#include "cli.hpp"

int main(int argc, char* argv[]);

#endif
