/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Near-Earth SGP4 Satellite Propagation Implementation
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#include <satdeliver/sgp4.hpp>

#include <cmath>

namespace satdeliver::sgp4 {

namespace {

// Atmospheric density fitting parameters (s and q0 in Earth radii)
constexpr double DENSITY_S_KM = 78.0;
constexpr double DENSITY_Q0_KM = 120.0;

// Perigee altitude below which the simplified drag model is used
constexpr double SIMPLE_DRAG_PERIGEE_KM = 220.0;

// Intermediate quantities shared by the initialization steps
struct Geometry {
    double cosio;
    double sinio;
    double cosio2;
    double omeosq;
    double rteosq;
};

// Recover the un-Kozai'd mean motion and the semi-major axis
void recoverMeanMotion(Model& model, const Geometry& g, double noKozai) {
    double a1 = std::pow(XKE / noKozai, X2O3);
    double d1 = 0.75 * J2 * (3.0 * g.cosio2 - 1.0) / (g.rteosq * g.omeosq);
    double del = d1 / (a1 * a1);
    double ao = a1 * (1.0 - del * (1.0 / 3.0 + del * (1.0 + 134.0 / 81.0 * del)));
    double delo = d1 / (ao * ao);
    model.noUnkozai = noKozai / (1.0 + delo);
    model.semiMajorAxis = std::pow(XKE / model.noUnkozai, X2O3);
}

// Drag and secular-rate coefficients
void computeCoefficients(Model& model, const Geometry& g, double rp) {
    const double a = model.semiMajorAxis;
    const double ecco = model.ecco;

    double sfour = DENSITY_S_KM / RADIUS_EARTH_KM + 1.0;
    double qzms24 = std::pow((DENSITY_Q0_KM - DENSITY_S_KM) / RADIUS_EARTH_KM, 4);
    double perigee = (rp - 1.0) * RADIUS_EARTH_KM;

    // Low perigees use a modified density profile
    if (perigee < 156.0) {
        sfour = perigee < 98.0 ? 20.0 : perigee - DENSITY_S_KM;
        qzms24 = std::pow((DENSITY_Q0_KM - sfour) / RADIUS_EARTH_KM, 4);
        sfour = sfour / RADIUS_EARTH_KM + 1.0;
    }

    double pinvsq = 1.0 / (a * a * g.omeosq * g.omeosq);
    double tsi = 1.0 / (a - sfour);
    model.eta = a * ecco * tsi;
    double etasq = model.eta * model.eta;
    double eeta = ecco * model.eta;
    double psisq = std::abs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);
    double cos2argp = std::cos(2.0 * model.argpo);

    double con41 = 3.0 * g.cosio2 - 1.0;
    double x1mth2 = 1.0 - g.cosio2;

    double cc2 = coef1 * model.noUnkozai * (a * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq))
                 + 0.375 * J2 * tsi / psisq * con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    model.cc1 = model.bstar * cc2;

    double cc3 = 0.0;
    if (ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * J3OJ2 * model.noUnkozai * g.sinio / ecco;
    }

    model.cc4 = 2.0 * model.noUnkozai * coef1 * a * g.omeosq
           * (model.eta * (2.0 + 0.5 * etasq) + ecco * (0.5 + 2.0 * etasq)
           - J2 * tsi / (a * psisq) * (-3.0 * con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta))
           + 0.75 * x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * cos2argp));
    model.cc5 = 2.0 * coef1 * a * g.omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    double cosio4 = g.cosio2 * g.cosio2;
    double temp1 = 1.5 * J2 * pinvsq * model.noUnkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * model.noUnkozai;
    model.mdot = model.noUnkozai + 0.5 * temp1 * g.rteosq * (3.0 * g.cosio2 - 1.0)
            + 0.0625 * temp2 * g.rteosq * (13.0 - 78.0 * g.cosio2 + 137.0 * cosio4);
    model.argpdot = -0.5 * temp1 * (1.0 - 5.0 * g.cosio2)
               + 0.0625 * temp2 * (7.0 - 114.0 * g.cosio2 + 395.0 * cosio4)
               + temp3 * (3.0 - 36.0 * g.cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * g.cosio;
    model.nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * g.cosio2) + 2.0 * temp3 * (3.0 - 7.0 * g.cosio2)) * g.cosio;
    model.omgcof = model.bstar * cc3 * std::cos(model.argpo);
    model.xmcof = ecco > 1.0e-4 ? -X2O3 * coef * model.bstar / eeta : 0.0;
    model.nodecf = 3.5 * g.omeosq * xhdot1 * model.cc1;
    model.t2cof = 1.5 * model.cc1;

    // Guard against division by zero for retrograde equatorial orbits
    double denom = std::abs(g.cosio + 1.0) > 1.5e-12 ? (1.0 + g.cosio) : 1.5e-12;
    model.xlcof = -0.25 * J3OJ2 * g.sinio * (3.0 + 5.0 * g.cosio) / denom;
    model.aycof = -0.5 * J3OJ2 * g.sinio;

    model.delmo = std::pow(1.0 + model.eta * std::cos(model.mo), 3);
    model.sinmao = std::sin(model.mo);

    model.isimp = rp < (SIMPLE_DRAG_PERIGEE_KM / RADIUS_EARTH_KM + 1.0);
    if (!model.isimp) {
        double c1sq = model.cc1 * model.cc1;
        model.d2 = 4.0 * a * tsi * c1sq;
        double temp = model.d2 * tsi * model.cc1 / 3.0;
        model.d3 = (17.0 * a + sfour) * temp;
        model.d4 = 0.5 * temp * a * tsi * (221.0 * a + 31.0 * sfour) * model.cc1;
        model.t3cof = model.d2 + 2.0 * c1sq;
        model.t4cof = 0.25 * (3.0 * model.d3 + model.cc1 * (12.0 * model.d2 + 10.0 * c1sq));
        model.t5cof = 0.2 * (3.0 * model.d4 + 12.0 * model.cc1 * model.d3
                      + 6.0 * model.d2 * model.d2 + 15.0 * c1sq * (2.0 * model.d2 + c1sq));
    }
}

} // namespace

// Compute Greenwich Sidereal Time for SGP4
double gstime(double jdut1) {
    double tut1 = (jdut1 - 2451545.0) / 36525.0;
    double temp = -6.2e-6 * tut1 * tut1 * tut1
                  + 0.093104 * tut1 * tut1
                  + (876600.0 * 3600 + 8640184.812866) * tut1
                  + 67310.54841;
    temp = std::fmod(temp * (M_PI / 180.0) / 240.0, TWO_PI);
    if (temp < 0.0) temp += TWO_PI;
    return temp;
}

Model initialize(const Elements& elements) {
    Model model;
    model.ecco = elements.eccentricity;
    model.inclo = elements.inclination;
    model.nodeo = elements.raan;
    model.argpo = elements.argPerigee;
    model.mo = elements.meanAnomaly;
    model.bstar = elements.bstar;

    model.jdEpoch = std::floor(elements.epochJD);
    model.jdEpochFraction = elements.epochJD - model.jdEpoch;

    if (model.ecco >= 1.0 || model.ecco < 0.0) {
        throw InvalidOrbitException("Eccentricity out of range: " + std::to_string(model.ecco));
    }
    if (elements.meanMotion <= 0.0) {
        throw InvalidOrbitException("Mean motion must be positive");
    }
    if (model.ecco < 1.0e-10) {
        model.ecco = 1.0e-10;
    }

    Geometry g;
    g.cosio = std::cos(model.inclo);
    g.sinio = std::sin(model.inclo);
    g.cosio2 = g.cosio * g.cosio;
    g.omeosq = 1.0 - model.ecco * model.ecco;
    g.rteosq = std::sqrt(g.omeosq);

    recoverMeanMotion(model, g, elements.meanMotion);

    if (TWO_PI / model.noUnkozai >= DEEP_SPACE_PERIOD_MINUTES) {
        throw InvalidOrbitException("Deep-space orbits (period >= 225 min) are not supported");
    }

    double rp = model.semiMajorAxis * (1.0 - model.ecco);
    if (rp < 1.0) {
        throw SatelliteDecayedException();
    }
    model.perigeeAltitudeKm = (rp - 1.0) * RADIUS_EARTH_KM;

    computeCoefficients(model, g, rp);
    return model;
}

Result propagate(const Model& model, double tsince) {
    // Secular gravity and atmospheric drag
    double xmdf = model.mo + model.mdot * tsince;
    double argpdf = model.argpo + model.argpdot * tsince;
    double nodedf = model.nodeo + model.nodedot * tsince;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = tsince * tsince;
    double nodem = nodedf + model.nodecf * t2;
    double tempa = 1.0 - model.cc1 * tsince;
    double tempe = model.bstar * model.cc4 * tsince;
    double templ = model.t2cof * t2;

    if (!model.isimp) {
        double delomg = model.omgcof * tsince;
        double delm = model.xmcof * (std::pow(1.0 + model.eta * std::cos(xmdf), 3) - model.delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * tsince;
        double t4 = t3 * tsince;
        tempa = tempa - model.d2 * t2 - model.d3 * t3 - model.d4 * t4;
        tempe = tempe + model.bstar * model.cc5 * (std::sin(mm) - model.sinmao);
        templ = templ + model.t3cof * t3 + t4 * (model.t4cof + tsince * model.t5cof);
    }

    double am = std::pow(XKE / model.noUnkozai, X2O3) * tempa * tempa;
    double nm = XKE / std::pow(am, 1.5);
    double em = model.ecco - tempe;

    if (em >= 1.0 || em < -0.001) {
        throw InvalidOrbitException("Eccentricity out of range during propagation: " + std::to_string(em));
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }
    if (nm <= 0.0) {
        throw SatelliteDecayedException();
    }

    mm = mm + model.noUnkozai * templ;
    double xlm = mm + argpm + nodem;
    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    double cosio = std::cos(model.inclo);
    double sinio = std::sin(model.inclo);
    double cosio2 = cosio * cosio;
    double omeosq = 1.0 - em * em;
    if (omeosq <= 0.0) {
        throw InvalidOrbitException("Semi-latus rectum is negative");
    }

    // Long period periodics
    double axnl = em * std::cos(argpm);
    double temp = 1.0 / (am * omeosq);
    double aynl = em * std::sin(argpm) + temp * model.aycof;
    double xl = mm + argpm + nodem + temp * model.xlcof * axnl;

    // Kepler's equation in equinoctial form
    double u = std::fmod(xl - nodem, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    double sineo1 = 0.0;
    double coseo1 = 0.0;
    for (int ktr = 1; std::abs(tem5) >= 1.0e-12 && ktr <= 10; ++ktr) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::abs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);
    if (pl < 0.0) {
        throw InvalidOrbitException("Semi-latus rectum is negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    // Short period periodics
    double con41 = 3.0 * cosio2 - 1.0;
    double x1mth2 = 1.0 - cosio2;
    double x7thm1 = 7.0 * cosio2 - 1.0;

    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodem + 1.5 * temp2 * cosio * sin2u;
    double xinc = model.inclo + 1.5 * temp2 * cosio * sinio * cos2u;
    double mvt = rdotl - nm * temp1 * x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / XKE;

    if (mrt < 1.0) {
        throw SatelliteDecayedException();
    }

    // Orientation vectors
    double sinsu = std::sin(su);
    double cossu = std::cos(su);
    double snod = std::sin(xnode);
    double cnod = std::cos(xnode);
    double sini = std::sin(xinc);
    double cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    double ux = xmx * sinsu + cnod * cossu;
    double uy = xmy * sinsu + snod * cossu;
    double uz = sini * sinsu;
    double vx = xmx * cossu - cnod * sinsu;
    double vy = xmy * cossu - snod * sinsu;
    double vz = sini * cossu;

    Result result;
    result.r[0] = mrt * ux * RADIUS_EARTH_KM;
    result.r[1] = mrt * uy * RADIUS_EARTH_KM;
    result.r[2] = mrt * uz * RADIUS_EARTH_KM;
    result.v[0] = (mvt * ux + rvdot * vx) * VKMPERSEC;
    result.v[1] = (mvt * uy + rvdot * vy) * VKMPERSEC;
    result.v[2] = (mvt * uz + rvdot * vz) * VKMPERSEC;
    return result;
}

} // namespace satdeliver::sgp4
