#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Correlate adjacent frames of a stored sequence, optionally write the result.
   Example:
     pathsweep-cli correlate --in=sweep.gif --out=corr.tif --view */
int run_correlate(int argc, char** argv);

/* Classify a stored sweep as triangle or square.
   Example:
     pathsweep-cli classify --in=sweep.gif --threshold=20 */
int run_classify (int argc, char** argv);

/* Process the four fixed tree-cover sweeps: write correlation videos and classify.
   Example:
     pathsweep-cli batch --assets=assets --outputs=outputs */
int run_batch    (int argc, char** argv);

/* Generate a synthetic triangular or square sweep.
   Example:
     pathsweep-cli simulate --shape=triangle --out=tri.sst */
int run_simulate (int argc, char** argv);
