#include "cli/CliParse.hpp"

#include "pixvox/ConfigIO.hpp"
#include "pixvox/Convert.hpp"
#include "pixvox/Hash.hpp"
#include "pixvox/ImageIO.hpp"
#include "pixvox/LogTee.hpp"
#include "pixvox/Version.hpp"
#include "pixvox/VoxelExport.hpp"
#include "pixvox/VoxelPreview.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace pixvox;
using namespace pixvox::cli;

void PrintHelp()
{
  std::cout
      << "pixvox_cli (image to sparse voxel grids)\n\n"
      << "Bin an image to a square grid and convert it with one or all of the height, color and\n"
      << "structure methods. Each grid is written as <method>_voxels.npz (NumPy) and/or .bin.\n\n"
      << "Usage:\n"
      << "  pixvox_cli --input <img.png|img.ppm> [--output <dir>] [--method <m>] [options]\n\n"
      << "General:\n"
      << "  --input <path>              Input image (PNG or PPM).\n"
      << "  --output <dir>              Output directory (default: output).\n"
      << "  --method <m>                height|color|structure|all (default: all).\n"
      << "  --resolution <N>            Binned grid side length (default: 64).\n"
      << "  --binning <mode>            area|nearest (default: area).\n"
      << "  --threads <N>               Worker threads for --method all; 0 = auto (default: 1).\n\n"
      << "Height:\n"
      << "  --max-height <M>            Grid depth; luma 255 -> M voxels (default: 32).\n"
      << "  --columns <mode>            solid|shell (default: solid).\n\n"
      << "Color:\n"
      << "  --layers <L>                Number of hue layers (default: 16).\n"
      << "  --achromatic <policy>       fallback|skip for gray cells (default: fallback).\n"
      << "  --achromatic-layer <K>      Layer used by the fallback policy (default: 0).\n"
      << "  --min-saturation <S>        0..255, below this a cell is achromatic (default: 30).\n"
      << "  --min-value <V>             0..255, below this a cell is achromatic (default: 30).\n\n"
      << "Structure:\n"
      << "  --depth-levels <D>          Grid depth (default: 24).\n"
      << "  --edge-threshold <F>        Sobel magnitude marking an edge cell (default: 128).\n"
      << "  --depth-mode <mode>         absolute|normalized (default: absolute).\n"
      << "  --distance-scale <F>        Cells of distance per depth level (default: 1).\n"
      << "  --shade-depth <0|1>         Darken deeper voxels (default: 0).\n\n"
      << "Outputs:\n"
      << "  --format <f>                npz|bin|both (default: npz).\n"
      << "  --json <out.json>           Write a JSON summary report.\n"
      << "  --preview <0|1>             Write <method>_top.png top-down previews (default: 0).\n"
      << "  --preview-scale <N>         Nearest-neighbor upscale for previews (default: 4).\n"
      << "  --slice <axis>:<index>      Write <method>_slice_<axis><index>.png cross-sections.\n\n"
      << "Configuration:\n"
      << "  --config <json>             Load options from JSON; flags given on the command line win.\n"
      << "  --write-config <json>       Write the effective options as JSON.\n\n"
      << "Logging:\n"
      << "  --log <path>                Duplicate stdout/stderr to a rotating log file.\n"
      << "  --log-keep <N>              Rotated log files to keep (default: 3).\n"
      << "  --quiet                     Only print errors.\n"
      << "  --version                   Print the version and exit.\n\n"
      << "Examples:\n"
      << "  pixvox_cli --input photo.png --method all --resolution 128 --threads 0\n\n"
      << "  pixvox_cli --input logo.ppm --method structure --depth-mode normalized --format both \\\n"
      << "    --preview 1 --json output/report.json\n";
}

struct Options {
  std::string inputPath;
  std::string outputDir = "output";
  std::string method = "all";
  ConvertMethod methodId = ConvertMethod::All;

  ConvertOptions convert;

  OutputFormat format = OutputFormat::Npz;
  std::string jsonPath;
  std::string writeConfigPath;

  bool preview = false;
  int previewScale = 4;

  bool slice = false;
  SliceRequest sliceRequest;

  std::string logPath;
  int logKeep = 3;
  bool quiet = false;
};

bool WritePreviewImage(const fs::path& path, const RgbImage& img, int scale, std::string& outError)
{
  const RgbImage scaled = (scale > 1) ? ScaleNearest(img, scale) : img;
  return WritePng(path.string(), scaled, outError);
}

int Run(int argc, char** argv)
{
  Options opt;

  if (argc <= 1) {
    PrintHelp();
    return 0;
  }

  // The config file is applied before any other flag so the command line overrides it.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) != "--config") continue;
    std::string err;
    if (!LoadConvertOptionsJsonFile(argv[i + 1], opt.convert, err)) {
      std::cerr << "Failed to load --config " << argv[i + 1] << ": " << err << "\n";
      return 2;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];

    auto need = [&](int n) -> bool { return (i + n) < argc; };

    if (const ConvertFlag* flag = FindConvertFlag(a)) {
      if (!need(1)) {
        std::cerr << a << " requires a value\n";
        return 2;
      }
      std::string err;
      if (!ApplyConvertFlag(*flag, argv[++i], opt.convert, err)) {
        std::cerr << err << "\n";
        return 2;
      }
      continue;
    }

    if (a == "--help" || a == "-h") {
      PrintHelp();
      return 0;
    } else if (a == "--version") {
      std::cout << "pixvox_cli " << PixVoxFullVersionString() << "\n";
      return 0;
    } else if (a == "--quiet") {
      opt.quiet = true;
    } else if (a == "--config") {
      if (!need(1)) {
        std::cerr << "--config requires a value\n";
        return 2;
      }
      ++i;
    } else if (a == "--input") {
      if (!need(1)) {
        std::cerr << "--input requires a value\n";
        return 2;
      }
      opt.inputPath = argv[++i];
    } else if (a == "--output") {
      if (!need(1)) {
        std::cerr << "--output requires a value\n";
        return 2;
      }
      opt.outputDir = argv[++i];
    } else if (a == "--method") {
      if (!need(1)) {
        std::cerr << "--method requires a value\n";
        return 2;
      }
      opt.method = argv[++i];
      if (!ParseConvertMethod(opt.method, opt.methodId)) {
        std::cerr << "Invalid --method (expected height|color|structure|all)\n";
        return 2;
      }
    } else if (a == "--format") {
      if (!need(1)) {
        std::cerr << "--format requires a value\n";
        return 2;
      }
      if (!ParseOutputFormat(argv[++i], opt.format)) {
        std::cerr << "Invalid --format (expected npz|bin|both)\n";
        return 2;
      }
    } else if (a == "--json") {
      if (!need(1)) {
        std::cerr << "--json requires a value\n";
        return 2;
      }
      opt.jsonPath = argv[++i];
    } else if (a == "--write-config") {
      if (!need(1)) {
        std::cerr << "--write-config requires a value\n";
        return 2;
      }
      opt.writeConfigPath = argv[++i];
    } else if (a == "--preview") {
      if (!need(1)) {
        std::cerr << "--preview requires a value 0|1\n";
        return 2;
      }
      if (!ParseToggle(argv[++i], opt.preview)) {
        std::cerr << "Invalid --preview (expected 0|1)\n";
        return 2;
      }
    } else if (a == "--preview-scale") {
      if (!need(1)) {
        std::cerr << "--preview-scale requires a value\n";
        return 2;
      }
      if (!ParseInt(argv[++i], opt.previewScale) || opt.previewScale < 1 || opt.previewScale > 64) {
        std::cerr << "Invalid --preview-scale (expected 1..64)\n";
        return 2;
      }
    } else if (a == "--slice") {
      if (!need(1)) {
        std::cerr << "--slice requires a value\n";
        return 2;
      }
      if (!ParseSliceRequest(argv[++i], opt.sliceRequest)) {
        std::cerr << "Invalid --slice (expected x|y|z:<index>)\n";
        return 2;
      }
      opt.slice = true;
    } else if (a == "--log") {
      if (!need(1)) {
        std::cerr << "--log requires a value\n";
        return 2;
      }
      opt.logPath = argv[++i];
    } else if (a == "--log-keep") {
      if (!need(1)) {
        std::cerr << "--log-keep requires a value\n";
        return 2;
      }
      if (!ParseInt(argv[++i], opt.logKeep) || opt.logKeep < 0) {
        std::cerr << "Invalid --log-keep\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown arg: " << a << "\n";
      std::cerr << "Run with --help for usage.\n";
      return 2;
    }
  }

  LogTee logTee;
  if (!opt.logPath.empty()) {
    LogTeeOptions lo;
    lo.path = opt.logPath;
    lo.keepFiles = opt.logKeep;
    std::string err;
    if (!logTee.start(lo, err)) {
      std::cerr << "Failed to start --log " << opt.logPath << (err.empty() ? "" : ": ") << err << "\n";
      return 2;
    }
  }

  if (opt.inputPath.empty()) {
    std::cerr << "--input is required\n";
    std::cerr << "Run with --help for usage.\n";
    return 2;
  }

  ConvertError verr;
  if (!ValidateConvertOptions(opt.convert, opt.methodId, verr)) {
    std::cerr << "Invalid options: " << verr.message << "\n";
    return 2;
  }

  if (!opt.writeConfigPath.empty()) {
    std::string err;
    if (!EnsureParentDir(opt.writeConfigPath, err) ||
        !WriteConvertOptionsJsonFile(opt.writeConfigPath, opt.convert, err)) {
      std::cerr << "Failed to write config: " << opt.writeConfigPath << (err.empty() ? "" : ": ") << err << "\n";
      return 2;
    }
    if (!opt.quiet) std::cout << "wrote " << opt.writeConfigPath << "\n";
  }

  RgbImage img;
  {
    std::string err;
    if (!ReadImageAuto(opt.inputPath, img, err)) {
      std::cerr << "Failed to read image: " << opt.inputPath << ": " << err << "\n";
      return 2;
    }
  }
  if (!opt.quiet) {
    std::cout << "input " << opt.inputPath << " (" << img.width << "x" << img.height << "), method " << opt.method
              << ", resolution " << opt.convert.voxelResolution << "\n";
  }

  ConversionResult result;
  ConvertError convErr;
  if (!Convert(img, opt.methodId, opt.convert, result, convErr)) {
    std::cerr << "Conversion failed (" << ConvertErrorCodeName(convErr.code) << "): " << convErr.message << "\n";
    return 2;
  }

  const fs::path outDir(opt.outputDir);
  {
    std::string err;
    if (!EnsureOutputDir(outDir, err)) {
      std::cerr << "Failed to create output directory: " << err << "\n";
      return 2;
    }
  }

  ConversionReportInfo info;
  info.inputPath = opt.inputPath;
  info.sourceWidth = img.width;
  info.sourceHeight = img.height;
  info.method = opt.method;

  for (const auto& kv : result) {
    const std::string& name = kv.first;
    const VoxelGrid& grid = kv.second;

    if (!opt.quiet) {
      std::cout << name << ": " << grid.size() << " voxels, grid " << grid.sizeX() << "x" << grid.sizeY() << "x"
                << grid.sizeZ() << ", hash " << HashHex(HashVoxelGrid(grid)) << "\n";
    }

    std::vector<fs::path> written;
    std::string err;

    if (WritesNpz(opt.format)) {
      const fs::path p = outDir / (name + "_voxels.npz");
      if (!WriteVoxelNpz(p.string(), grid, err)) {
        std::cerr << "Failed to write " << p.string() << ": " << err << "\n";
        return 2;
      }
      written.push_back(p);
    }

    if (WritesBin(opt.format)) {
      const fs::path p = outDir / (name + "_voxels.bin");
      if (!WriteVoxelBinary(p.string(), grid, err)) {
        std::cerr << "Failed to write " << p.string() << ": " << err << "\n";
        return 2;
      }
      written.push_back(p);
    }

    PreviewOptions po;

    if (opt.preview) {
      RgbImage top;
      const fs::path p = outDir / (name + "_top.png");
      if (!RenderTopDown(grid, po, top, err) || !WritePreviewImage(p, top, opt.previewScale, err)) {
        std::cerr << "Failed to write preview " << p.string() << ": " << err << "\n";
        return 2;
      }
      written.push_back(p);
    }

    if (opt.slice) {
      RgbImage sl;
      const fs::path p = outDir / SliceFileName(name, opt.sliceRequest);
      if (!RenderSlice(grid, opt.sliceRequest.axis, opt.sliceRequest.index, po, sl, err) ||
          !WritePreviewImage(p, sl, opt.previewScale, err)) {
        std::cerr << "Failed to write slice " << p.string() << ": " << err << "\n";
        return 2;
      }
      written.push_back(p);
    }

    for (const fs::path& p : written) {
      info.outputs.push_back(p.string());
      if (!opt.quiet) std::cout << "wrote " << p.string() << "\n";
    }
  }

  if (!opt.jsonPath.empty()) {
    std::string err;
    if (!EnsureParentDir(opt.jsonPath, err) ||
        !WriteConversionReportJsonFile(opt.jsonPath, info, result, opt.convert, err)) {
      std::cerr << "Failed to write JSON: " << opt.jsonPath << (err.empty() ? "" : ": ") << err << "\n";
      return 2;
    }
    if (!opt.quiet) std::cout << "wrote " << opt.jsonPath << "\n";
  }

  return 0;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "pixvox_cli: " << e.what() << "\n";
    return 1;
  }
}
