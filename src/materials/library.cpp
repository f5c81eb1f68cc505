#include "ultrafast/materials/library.hpp"

namespace ultrafast {
namespace materials {

const DispersiveMaterial &air() {
  static const DispersiveMaterial material(
      "air", "formula 6", {0.0, 0.05792105, 238.0185, 0.00167917, 57.362},
      ValidRange(0.23, 1.69),
      MaterialInfo{"P. E. Ciddor. Refractive index of air: new equations for "
                   "the visible and near infrared, Appl. Optics 35, 1566-1573 "
                   "(1996)",
                   "Standard air: dry air at 15 °C, 101.325 kPa and with 450 "
                   "ppm CO2 content.",
                   {{"temperature", "15 °C"}}});
  return material;
}

const DispersiveMaterial &fused_silica() {
  static const DispersiveMaterial material(
      "fused silica", "formula 1",
      {0.0, 0.6961663, 0.0684043, 0.4079426, 0.1162414, 0.8974794, 9.896161},
      ValidRange(0.21, 6.7),
      MaterialInfo{"I. H. Malitson. Interspecimen comparison of the "
                   "refractive index of fused silica, J. Opt. Soc. Am. 55, "
                   "1205-1208 (1965)",
                   "Room temperature", {{"temperature", "20 °C"}}});
  return material;
}

const DispersiveMaterial &bk7() {
  static const DispersiveMaterial material(
      "N-BK7", "formula 2",
      {0.0, 1.03961212, 0.00600069867, 0.231792344, 0.0200179144, 1.01046945,
       103.560653},
      ValidRange(0.3, 2.5),
      MaterialInfo{"SCHOTT Zemax catalog 2017-01-20b", "", {}});
  return material;
}

} // namespace materials
} // namespace ultrafast
