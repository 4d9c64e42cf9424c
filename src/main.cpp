/**
 * @file main.cpp
 * @brief Main entry point for the HexMosaic command line tool
 *
 * Builds hex lattices, segments, elevation palettes and mosaic class
 * layers for a HexMosaic project directory.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cli/CommandLineInterface.hpp"

using namespace hexmosaic;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    return cli.run(argc, argv);
}

// Example usage commands:
//
// Project setup:
// ./hexmosaic create-config --project-dir ~/maps/bohemia
// ./hexmosaic create-aoi -p ~/maps/bohemia --crs EPSG:4326 --center 15.1,49.2 --width 40km --height 30km
//
// Lattice and segments:
// ./hexmosaic tessellate -p ~/maps/bohemia --aoi Layers/AOI_1_40000m_x_30000m.shp --hex-size 1km
// ./hexmosaic segment -p ~/maps/bohemia --aoi Layers/AOI_1_40000m_x_30000m.shp \
//            --mode map-tile --scale 1:50k --alignment minute --offset-ns 7.5arcmin
//
// Elevation and mosaic:
// ./hexmosaic sample-elevation -p ~/maps/bohemia --dem srtm.tif --hexes hex_tiles_1000m.shp --method median
// ./hexmosaic classify -p ~/maps/bohemia --hexes hex_tiles_1000m.shp \
//            --sources landuse.shp,waterways.shp,roads.shp --area-threshold 0.25
