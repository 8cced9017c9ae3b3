#pragma once

/**
 *  @defgroup applications applications
 */

#include <biodispatch/applications/samtools/samtools.hpp>
