/*---------------------------------------------------------*/
/*                                                         */
/*   halfblock_main.cpp - Print an image to the terminal   */
/*                                                         */
/*   halfblock <image> [output.txt] [--width N]            */
/*             [--engine stb|opencv] [--transparent #hex]  */
/*             [--marker #hex:lat,lon]... [--point #hex:x,y]...*/
/*             [--demo-markers] [--verbose]                */
/*                                                         */
/*---------------------------------------------------------*/

#include "halfblock_image.h"
#include "halfblock_errors.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

const int EXIT_OK = 0;
const int EXIT_ERROR = 1;
const int EXIT_INVALID = 2;

struct MarkerArg {
    std::string color;
    double a = 0, b = 0;
    bool spherical = true;
};

struct CliArgs {
    std::string pathInput;
    std::string pathOutput;
    RenderOptions options;
    std::vector<MarkerArg> markers;
    bool help = false;
};

void printUsage(FILE* out)
{
    fprintf(out,
        "Usage: halfblock <path-input> [path-output] [options]\n"
        "Prints the given image to the terminal as truecolor half-block text.\n"
        "\n"
        "  --width N              output columns (default 80)\n"
        "  --engine stb|opencv    decode/resize backend (default stb)\n"
        "  --transparent #RRGGBB  color treated as transparent (default #000000)\n"
        "  --marker #RRGGBB:LAT,LON  marker at a geographic coordinate\n"
        "  --point #RRGGBB:X,Y    marker at a pixel of the resized image\n"
        "  --demo-markers         New York, Oslo and (0,0) markers\n"
        "  --verbose              log decode/resize steps to stderr\n");
}

// Accepts "--key value" and "--key=value".
bool takeValue(int argc, char** argv, int& i, const char* key, std::string& value)
{
    size_t len = std::strlen(key);
    if (std::strcmp(argv[i], key) == 0) {
        if (i + 1 >= argc)
            throw std::invalid_argument(std::string("Missing value for ") + key + ".");
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], key, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

// "#ff0000:40.71,-74.01"
MarkerArg parseMarker(const std::string& arg, bool spherical)
{
    size_t colon = arg.rfind(':');
    size_t comma = arg.find(',', colon == std::string::npos ? 0 : colon);
    if (colon == std::string::npos || comma == std::string::npos)
        throw std::invalid_argument("Invalid marker \"" + arg + "\" (expected COLOR:A,B).");

    MarkerArg m;
    m.color = arg.substr(0, colon);
    m.spherical = spherical;
    try {
        m.a = std::stod(arg.substr(colon + 1, comma - colon - 1));
        m.b = std::stod(arg.substr(comma + 1));
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid marker \"" + arg + "\" (coordinates must be numbers).");
    }
    return m;
}

CliArgs parseArgs(int argc, char** argv)
{
    CliArgs args;
    std::vector<std::string> positional;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            args.help = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            args.options.verbose = true;
        } else if (std::strcmp(argv[i], "--demo-markers") == 0) {
            args.markers.push_back(MarkerArg{ "#ff0000", 40.71, -74.01, true });
            args.markers.push_back(MarkerArg{ "#00ff00", 59.91, 10.75, true });
            args.markers.push_back(MarkerArg{ "#0000ff", .0, .0, true });
        } else if (takeValue(argc, argv, i, "--width", value)) {
            args.options.width = std::atoi(value.c_str());
        } else if (takeValue(argc, argv, i, "--engine", value)) {
            args.options.engine = value;
        } else if (takeValue(argc, argv, i, "--transparent", value)) {
            args.options.transparentColor = value;
        } else if (takeValue(argc, argv, i, "--marker", value)) {
            args.markers.push_back(parseMarker(value, true));
        } else if (takeValue(argc, argv, i, "--point", value)) {
            args.markers.push_back(parseMarker(value, false));
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            throw std::invalid_argument(std::string("Unknown option ") + argv[i] + ".");
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (positional.size() > 2)
        throw std::invalid_argument("Too many arguments.");
    if (!positional.empty()) args.pathInput = positional[0];
    if (positional.size() > 1) args.pathOutput = positional[1];
    return args;
}

bool fileExists(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

int main(int argc, char** argv)
{
    CliArgs args;
    try {
        args = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "%s\n", e.what());
        printUsage(stderr);
        return EXIT_INVALID;
    }

    if (args.help) {
        printUsage(stdout);
        return EXIT_OK;
    }

    if (args.pathInput.empty()) {
        fprintf(stderr, "No image path given.\n");
        printUsage(stderr);
        return EXIT_INVALID;
    }

    if (!fileExists(args.pathInput)) {
        fprintf(stderr, "Unable to find given file \"%s\".\n", args.pathInput.c_str());
        return EXIT_INVALID;
    }

    try {
        HalfBlockImage image = HalfBlockImage::fromFile(args.pathInput, args.options);
        for (const MarkerArg& m : args.markers) {
            if (m.spherical)
                image.addMarkerSpherical(m.color, m.a, m.b);
            else
                image.addMarker(m.color, Point(m.a, m.b));
        }

        std::string text = image.toString();
        std::cout << text << std::endl;

        if (!args.pathOutput.empty()) {
            std::ofstream out(args.pathOutput, std::ios::binary);
            if (!out || !(out << text)) {
                fprintf(stderr, "Unable to write \"%s\".\n", args.pathOutput.c_str());
                return EXIT_ERROR;
            }
            std::cout << "---\n"
                      << "Image saved to \"" << args.pathOutput << "\".\n"
                      << "---" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_ERROR;
    }
    return EXIT_OK;
}
