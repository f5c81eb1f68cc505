#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "ultrafast/catalog/catalog_entry.hpp"
#include "ultrafast/catalog/lookup.hpp"
#include "ultrafast/errors.hpp"
#include "ultrafast/materials/dispersive.hpp"
#include "ultrafast/materials/library.hpp"
#include "ultrafast/settings.hpp"
#include "ultrafast/units.hpp"

namespace py = pybind11;
using namespace ultrafast;
using namespace ultrafast::materials;

PYBIND11_MODULE(pyultrafast, m) {
  m.doc() = "Python bindings for the ultrafast dispersive-materials library.";

  // Exception hierarchy
  static py::exception<Error> error(m, "UltrafastError");
  static py::exception<RangeError> range_error(m, "RangeError", error.ptr());
  static py::exception<OutOfRangeError> out_of_range(m, "OutOfRangeError",
                                                     range_error.ptr());
  static py::exception<NotFoundError> not_found(m, "NotFoundError", error.ptr());
  static py::exception<ParseError> parse_error(m, "ParseError", error.ptr());
  static py::exception<ConfigurationError> config_error(
      m, "ConfigurationError", error.ptr());
  static py::exception<EvaluationError> eval_error(m, "EvaluationError",
                                                   error.ptr());
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p)
        std::rethrow_exception(p);
    } catch (const OutOfRangeError &e) {
      out_of_range(e.what());
    } catch (const RangeError &e) {
      range_error(e.what());
    } catch (const NotFoundError &e) {
      not_found(e.what());
    } catch (const ParseError &e) {
      parse_error(e.what());
    } catch (const ConfigurationError &e) {
      config_error(e.what());
    } catch (const EvaluationError &e) {
      eval_error(e.what());
    } catch (const Error &e) {
      error(e.what());
    }
  });

  m.attr("c") = c;
  m.def("frequency", &frequency, "Wavelength (um) to angular frequency (rad/fs).",
        py::arg("lambda_"));
  m.def("wavelength", &wavelength,
        "Angular frequency (rad/fs) to wavelength (um).", py::arg("omega"));

  py::enum_<RangePolicy>(m, "RangePolicy")
      .value("Default", RangePolicy::Default)
      .value("Reject", RangePolicy::Reject)
      .value("Warn", RangePolicy::Warn);

  py::class_<ValidRange>(m, "ValidRange", "Wavelength interval (um).")
      .def(py::init<double, double>(), py::arg("low"), py::arg("high"))
      .def_readonly("min", &ValidRange::min)
      .def_readonly("max", &ValidRange::max)
      .def("contains", &ValidRange::contains, py::arg("lambda_"));

  py::class_<SourceBlock>(m, "SourceBlock")
      .def_readonly("type", &SourceBlock::type)
      .def_readonly("range", &SourceBlock::range)
      .def_readonly("coefficients", &SourceBlock::coefficients);

  py::class_<MaterialInfo>(m, "MaterialInfo")
      .def(py::init<>())
      .def_readwrite("references", &MaterialInfo::references)
      .def_readwrite("comments", &MaterialInfo::comments)
      .def_readwrite("specs", &MaterialInfo::specs)
      .def_readonly("blocks", &MaterialInfo::blocks)
      .def_readonly("primary", &MaterialInfo::primary)
      .def_property_readonly("temperature", &MaterialInfo::temperature);

  py::class_<DispersiveMaterial>(
      m, "DispersiveMaterial",
      "Optical material with a wavelength-dependent refractive index.\n\n"
      "Example:\n"
      "    glass = DispersiveMaterial('glass', 'formula 1',\n"
      "        [0, 0.6961663, 0.0684043, 0.4079426, 0.1162414, 0.8974794, "
      "9.896161],\n"
      "        ValidRange(0.21, 6.7))\n"
      "    glass.gvd(0.8)  # fs^2/mm")
      .def(py::init<std::string, const std::string &, const std::vector<double> &,
                    const ValidRange &, MaterialInfo>(),
           py::arg("name"), py::arg("kind"), py::arg("coefficients"),
           py::arg("range"), py::arg("info") = MaterialInfo())
      .def_property_readonly("name", &DispersiveMaterial::name)
      .def_property_readonly("kind",
                             [](const DispersiveMaterial &mat) {
                               return mat.formula().kind();
                             })
      .def_property_readonly("coefficients",
                             [](const DispersiveMaterial &mat) {
                               return mat.formula().coefficients();
                             })
      .def_property_readonly("range", &DispersiveMaterial::range)
      .def_property_readonly("frequency_range",
                             &DispersiveMaterial::frequency_range)
      .def_property_readonly("info", &DispersiveMaterial::info)
      .def("n",
           py::overload_cast<double, RangePolicy>(&DispersiveMaterial::n,
                                                  py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("n",
           py::overload_cast<const Eigen::ArrayXd &, RangePolicy>(
               &DispersiveMaterial::n, py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("group_index",
           py::overload_cast<double, RangePolicy>(
               &DispersiveMaterial::group_index, py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("group_index",
           py::overload_cast<const Eigen::ArrayXd &, RangePolicy>(
               &DispersiveMaterial::group_index, py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("gvd",
           py::overload_cast<double, RangePolicy>(&DispersiveMaterial::gvd,
                                                  py::const_),
           "Group-velocity dispersion in fs^2/mm.", py::arg("lambda_"),
           py::arg("policy") = RangePolicy::Default)
      .def("gvd",
           py::overload_cast<const Eigen::ArrayXd &, RangePolicy>(
               &DispersiveMaterial::gvd, py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("group_velocity", &DispersiveMaterial::group_velocity,
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default)
      .def("n_at_frequency", &DispersiveMaterial::n_at_frequency,
           py::arg("omega"), py::arg("policy") = RangePolicy::Default)
      .def("wavevector", &DispersiveMaterial::wavevector, py::arg("omega"),
           py::arg("policy") = RangePolicy::Default)
      .def("brewster",
           py::overload_cast<double, const DispersiveMaterial &, RangePolicy>(
               &DispersiveMaterial::brewster, py::const_),
           py::arg("lambda_"), py::arg("incident"),
           py::arg("policy") = RangePolicy::Default)
      .def("brewster",
           py::overload_cast<double, RangePolicy>(&DispersiveMaterial::brewster,
                                                  py::const_),
           py::arg("lambda_"), py::arg("policy") = RangePolicy::Default);

  m.def("air", &air, py::return_value_policy::reference);
  m.def("fused_silica", &fused_silica, py::return_value_policy::reference);
  m.def("bk7", &bk7, py::return_value_policy::reference);

  // Catalog submodule
  py::module_ cat = m.def_submodule(
      "catalog", "Local RefractiveIndex.info database mirror.");

  py::class_<catalog::DataBlock>(cat, "DataBlock")
      .def_readonly("type", &catalog::DataBlock::type)
      .def_readonly("range", &catalog::DataBlock::range)
      .def_readonly("coefficients", &catalog::DataBlock::coefficients);

  py::class_<catalog::CatalogEntry>(cat, "CatalogEntry")
      .def_readonly("references", &catalog::CatalogEntry::references)
      .def_readonly("comments", &catalog::CatalogEntry::comments)
      .def_readonly("data", &catalog::CatalogEntry::data)
      .def_readonly("specs", &catalog::CatalogEntry::specs)
      .def("to_yaml", &catalog::to_yaml);

  cat.def("load_entry", &catalog::load_catalog_entry, py::arg("path"));
  cat.def("make_material", &catalog::make_material, py::arg("entry"),
          py::arg("name"));
  cat.def("to_catalog_entry", &catalog::to_catalog_entry, py::arg("material"));

  py::class_<catalog::RefractiveIndexLookup>(cat, "RefractiveIndexLookup")
      .def(py::init<std::filesystem::path>(), py::arg("root"))
      .def("exists", &catalog::RefractiveIndexLookup::exists, py::arg("id"))
      .def("entry", &catalog::RefractiveIndexLookup::entry, py::arg("id"))
      .def("material", &catalog::RefractiveIndexLookup::material, py::arg("id"))
      .def("pages", &catalog::RefractiveIndexLookup::pages, py::arg("shelf"),
           py::arg("book"));

  m.def("load_settings_and_apply", [](const std::filesystem::path &path) {
    Settings s = load_settings(path);
    apply(s);
    return s.catalog_root;
  }, py::arg("path"));
}
