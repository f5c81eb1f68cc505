#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include <Eigen/Core>

#include "ultrafast/catalog/lookup.hpp"
#include "ultrafast/errors.hpp"
#include "ultrafast/materials/library.hpp"
#include "ultrafast/settings.hpp"

using namespace ultrafast;

namespace {

materials::DispersiveMaterial pick_material(const Settings &settings,
                                            const std::string &id) {
  if (settings.catalog_root.empty()) {
    // No mirror configured: only a direct path to an entry file works
    return catalog::make_material(catalog::load_catalog_entry(id), id);
  }
  catalog::RefractiveIndexLookup lookup(settings.catalog_root);
  return lookup.material(id);
}

} // namespace

int main(int argc, char **argv) {
  if (argc != 1 && argc != 2 && argc != 5) {
    std::cerr << "Usage: " << argv[0]
              << " [<material-id> [<lambda_min_um> <lambda_max_um> <steps>]]\n"
              << "Catalog root is read from ULTRAFAST_CATALOG or the settings "
                 "file named by ULTRAFAST_CONFIG.\n";
    return 1;
  }

  try {
    Settings settings = default_settings();
    const char *config = std::getenv("ULTRAFAST_CONFIG");
    if (config && config[0] != '\0')
      settings = load_settings(config);
    apply(settings);

    materials::DispersiveMaterial mat =
        argc > 1 ? pick_material(settings, argv[1]) : materials::fused_silica();

    // Visible/near-IR window by default; infrared-only materials use their
    // whole range
    double lo = mat.range().min;
    double hi = mat.range().min < 2.0 ? std::min(mat.range().max, 2.0)
                                      : mat.range().max;
    int steps = 11;
    if (argc == 5) {
      lo = std::stod(argv[2]);
      hi = std::stod(argv[3]);
      steps = std::stoi(argv[4]);
    }
    if (steps < 2)
      steps = 2;

    Eigen::ArrayXd lambda = Eigen::ArrayXd::LinSpaced(steps, lo, hi);
    Eigen::ArrayXd n = mat.n(lambda);
    Eigen::ArrayXd ng = mat.group_index(lambda);
    Eigen::ArrayXd gvd = mat.gvd(lambda);

    std::cout << mat.name() << " (" << mat.formula().kind() << ", "
              << mat.range().min << " - " << mat.range().max << " um)\n";
    if (!mat.info().references.empty())
      std::cout << "ref: " << mat.info().references << "\n";
    std::cout << std::setw(12) << "lambda[um]" << std::setw(12) << "n"
              << std::setw(12) << "n_g" << std::setw(16) << "GVD[fs^2/mm]"
              << "\n";
    std::cout << std::fixed;
    for (Eigen::Index i = 0; i < lambda.size(); ++i) {
      std::cout << std::setprecision(4) << std::setw(12) << lambda[i]
                << std::setprecision(6) << std::setw(12) << n[i]
                << std::setw(12) << ng[i] << std::setprecision(2)
                << std::setw(16) << gvd[i] << "\n";
    }
  } catch (const Error &e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::logic_error &e) {
    std::cerr << "error: bad numeric argument (" << e.what() << ")\n";
    return 1;
  }
  return 0;
}
