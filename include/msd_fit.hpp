#ifndef MSD_FIT_HPP
#define MSD_FIT_HPP

// Include all library headers here
#include "analysis_config.hpp"
#include "curve_fitter.hpp"
#include "fit_result_aggregator.hpp"
#include "msd_computer.hpp"
#include "replicate_analysis.hpp"
#include "step_angle_extractor.hpp"
#include "track_store.hpp"

// This is the main header file for the msd_fit library
// Include this single header to access all functionality

#endif // MSD_FIT_HPP
