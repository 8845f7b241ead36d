#ifndef EIS_SIM_HPP
#define EIS_SIM_HPP

// Include all library headers here
#include "circuit_fitter.hpp"
#include "circuit_model.hpp"
#include "corrosion_features.hpp"
#include "csv_io.hpp"
#include "dataset_export.hpp"
#include "eis_errors.hpp"
#include "eis_simulator.hpp"
#include "feature_encoder.hpp"
#include "frequency_grid.hpp"
#include "impedance_elements.hpp"
#include "mat_file.hpp"
#include "parameter_sampler.hpp"
#include "parameter_schema.hpp"
#include "simulation_config.hpp"

// This is the main header file for the eis_sim library
// Include this single header to access all functionality

#endif // EIS_SIM_HPP
