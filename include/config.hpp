#pragma once

namespace cavegeo
{

    struct Config
    {
        /** Projected CRS the plans are georeferenced into (PL-1992). */
        static constexpr const char *DEFAULT_TARGET_CRS = "EPSG:2180";
        static constexpr const char *WGS84_CRS = "EPSG:4326";
        static constexpr double PL1992_CENTRAL_MERIDIAN_DEG = 19.0;

        static constexpr const char *CAVES_FILE = "caves_transformed.jsonl";
        static constexpr const char *IMAGE_DIR = "caves_upscaled";
        static constexpr const char *OUTPUT_DIR = "georeferenced_output";
        static constexpr bool APPLY_GRID_CONVERGENCE = true;

        static constexpr const char *PLAN_GRAPHICS_TYPES[2] = {"plan", "plan i przekrój"};
        static constexpr const char *WORLD_FILE_EXTENSIONS[4] = {".tfw", ".jgw", ".pgw", ".wld"};

        static constexpr const char *WINDOW_NAME = "Georeferencing Tool";
        /** Initial window width; highgui keeps reporting clicks in image coordinates. */
        static constexpr int MAX_DISPLAY_WIDTH_PX = 1400;
        static constexpr int EVENT_POLL_MS = 50;

        static constexpr int KEY_ESCAPE = 27;
        static constexpr int KEY_ENTER = 13;
        static constexpr int KEY_LINE_FEED = 10;
        static constexpr int KEY_SPACE = 32;
        static constexpr int KEY_SKIP_NORTH_LOWER = 's';
        static constexpr int KEY_SKIP_NORTH_UPPER = 'S';

        /** Marker colours, BGR. */
        static constexpr int REFERENCE_COLOR_BGR[3] = {0, 0, 255};
        static constexpr int SCALE_COLOR_BGR[3] = {0, 255, 0};
        static constexpr int NORTH_COLOR_BGR[3] = {255, 0, 0};
        static constexpr int MARKER_DOT_RADIUS_PX = 5;
        static constexpr int MARKER_RING_RADIUS_PX = 15;
        static constexpr double ARROW_TIP_LENGTH = 0.2;

        static constexpr const char *GEOTIFF_DRIVER = "GTiff";
        static constexpr const char *GEOTIFF_COMPRESS = "LZW";

        /** Relative tolerance for the reference pixel landing on its world point. */
        static constexpr double ANCHOR_TOLERANCE = 1e-9;
    };

}
