#pragma once

// Certificates exported from GnuPG for cases librnp cannot generate.

namespace wkd {
namespace testing {

// Alice <alice@example.com> (ed25519, 0215337324269432FC6E295434AE2CD0E4BFAA06)
// with a JPEG user attribute, a cv25519 encryption subkey
// (228D77905608768FF74E27AFAAF19EECF900D666) and an ed25519 signing subkey
// (4374C02FFD844F0752ED15A494753BA22335A029).
constexpr const char* kPhotoCertificate = R"(-----BEGIN PGP PUBLIC KEY BLOCK-----

mDMEatY9/BYJKwYBBAHaRw8BAQdACs7Zi1iJVXvhR8mC++2VuNnxU26a6/XURMnN
RgTMmYa0GUFsaWNlIDxhbGljZUBleGFtcGxlLmNvbT6IkAQTFggAOBYhBAIVM3Mk
JpQy/G4pVDSuLNDkv6oGBQJq1j38AhsBBQsJCAcCBhUKCQgLAgQWAgMBAh4BAheA
AAoJEDSuLNDkv6oGm2IA/1t9NJZ+R4gDfl1ylR9KAZite8JGkyTotb+zQMb1RMdc
AP9ZJ/HkmDWMf954FRz972Z9Np9q0birC9w5X+1Lcj+PBdHAn8CdARAAAQEAAAAA
AAAAAAAAAAD/2P/gABBKRklGAAEBAAABAAEAAP/bAEMACAYGBwYFCAcHBwkJCAoM
FA0MCwsMGRITDxQdGh8eHRocHCAkLicgIiwjHBwoNyksMDE0NDQfJzk9ODI8LjM0
Mv/AAAsIAAEAAQEBEQD/xAAfAAABBQEBAQEBAQAAAAAAAAAAAQIDBAUGBwgJCgv/
xAC1EAACAQMDAgQDBQUEBAAAAX0BAgMABBEFEiExQQYTUWEHInEUMoGRoQgjQrHB
FVLR8CQzYnKCCQoWFxgZGiUmJygpKjQ1Njc4OTpDREVGR0hJSlNUVVZXWFlaY2Rl
ZmdoaWpzdHV2d3h5eoOEhYaHiImKkpOUlZaXmJmaoqOkpaanqKmqsrO0tba3uLm6
wsPExcbHyMnK0tPU1dbX2Nna4eLj5OXm5+jp6vHy8/T19vf4+fr/2gAIAQEAAD8A
+9P/2YiQBBMWCAA4FiEEAhUzcyQmlDL8bilUNK4s0OS/qgYFAmrWPfwCGwEFCwkI
BwIGFQoJCAsCBBYCAwECHgECF4AACgkQNK4s0OS/qgbIRQD7BzYABSNfBk49yg/P
FLhUKs8S/PcDEcbkcamY4rPNu8ABAIouwCg42YlT5yABteOx6GtF3LY9o6AqOoSO
SS1eokQAuDgEatY9/BIKKwYBBAGXVQEFAQEHQEfs3c4FayaaL2gKLHoLJAj9xKhl
gLWqtlt7UnQDQtd9AwEIB4h4BBgWCAAgFiEEAhUzcyQmlDL8bilUNK4s0OS/qgYF
AmrWPfwCGwwACgkQNK4s0OS/qgaDfgD+J8yX+WxKIKBZ2iCO7dsYNw741s4JNuUZ
cSSiWflX0agA/ip0xqgPCC0AHyS9gpWZcyhE0R8k8bSrSEbVDeIjO1oLuDMEatY9
/BYJKwYBBAHaRw8BAQdAmGfDKWalp3yUG9QpM4KWfySfEUmTwiitMTTzwNEkQsWI
7wQYFggAIBYhBAIVM3MkJpQy/G4pVDSuLNDkv6oGBQJq1j38AhsCAIEJEDSuLNDk
v6oGdiAEGRYIAB0WIQRDdMAv/YRPB1LtFaSUdTuiIzWgKQUCatY9/AAKCRCUdTui
IzWgKbePAP0Rvkxi13tYth+MXt96WwRtggKEcRKW1M+Ozt/jgAIa1wEA/+l+TOA8
1igaZ67g6/2sx1NYZ9SQsAl5BRDAj89XEwFo4AD6A28kM19tYjq5uZU85y1ugzFE
uQQ0Owvf34KssrSf9X8BAOJCjSftmsP6GKnBusow4KZg3GpLv5koQhx+ZFmdL+AL
=GyrH
-----END PGP PUBLIC KEY BLOCK-----
)";

// The same certificate with the binding signature of the signing subkey removed.
constexpr const char* kUnboundSubkeyCertificate = R"(-----BEGIN PGP PUBLIC KEY BLOCK-----

mDMEatY9/BYJKwYBBAHaRw8BAQdACs7Zi1iJVXvhR8mC++2VuNnxU26a6/XURMnN
RgTMmYa0GUFsaWNlIDxhbGljZUBleGFtcGxlLmNvbT6IkAQTFggAOBYhBAIVM3Mk
JpQy/G4pVDSuLNDkv6oGBQJq1j38AhsBBQsJCAcCBhUKCQgLAgQWAgMBAh4BAheA
AAoJEDSuLNDkv6oGm2IA/1t9NJZ+R4gDfl1ylR9KAZite8JGkyTotb+zQMb1RMdc
AP9ZJ/HkmDWMf954FRz972Z9Np9q0birC9w5X+1Lcj+PBdHAn8CdARAAAQEAAAAA
AAAAAAAAAAD/2P/gABBKRklGAAEBAAABAAEAAP/bAEMACAYGBwYFCAcHBwkJCAoM
FA0MCwsMGRITDxQdGh8eHRocHCAkLicgIiwjHBwoNyksMDE0NDQfJzk9ODI8LjM0
Mv/AAAsIAAEAAQEBEQD/xAAfAAABBQEBAQEBAQAAAAAAAAAAAQIDBAUGBwgJCgv/
xAC1EAACAQMDAgQDBQUEBAAAAX0BAgMABBEFEiExQQYTUWEHInEUMoGRoQgjQrHB
FVLR8CQzYnKCCQoWFxgZGiUmJygpKjQ1Njc4OTpDREVGR0hJSlNUVVZXWFlaY2Rl
ZmdoaWpzdHV2d3h5eoOEhYaHiImKkpOUlZaXmJmaoqOkpaanqKmqsrO0tba3uLm6
wsPExcbHyMnK0tPU1dbX2Nna4eLj5OXm5+jp6vHy8/T19vf4+fr/2gAIAQEAAD8A
+9P/2YiQBBMWCAA4FiEEAhUzcyQmlDL8bilUNK4s0OS/qgYFAmrWPfwCGwEFCwkI
BwIGFQoJCAsCBBYCAwECHgECF4AACgkQNK4s0OS/qgbIRQD7BzYABSNfBk49yg/P
FLhUKs8S/PcDEcbkcamY4rPNu8ABAIouwCg42YlT5yABteOx6GtF3LY9o6AqOoSO
SS1eokQAuDgEatY9/BIKKwYBBAGXVQEFAQEHQEfs3c4FayaaL2gKLHoLJAj9xKhl
gLWqtlt7UnQDQtd9AwEIB4h4BBgWCAAgFiEEAhUzcyQmlDL8bilUNK4s0OS/qgYF
AmrWPfwCGwwACgkQNK4s0OS/qgaDfgD+J8yX+WxKIKBZ2iCO7dsYNw741s4JNuUZ
cSSiWflX0agA/ip0xqgPCC0AHyS9gpWZcyhE0R8k8bSrSEbVDeIjO1oLuDMEatY9
/BYJKwYBBAHaRw8BAQdAmGfDKWalp3yUG9QpM4KWfySfEUmTwiitMTTzwNEkQsU=
=j5f2
-----END PGP PUBLIC KEY BLOCK-----
)";

// 368B6E1C1DB12F5B43E279B87501D56B5E0D914F with two user ids for
// alice@example.com: "A. Example <alice@example.com>" (valid) followed by
// "Alice <alice@example.com>" (revoked by its owner).
constexpr const char* kRevokedDuplicateUserIdCertificate = R"(-----BEGIN PGP PUBLIC KEY BLOCK-----

mDMEatY+QRYJKwYBBAHaRw8BAQdA16mjEucwx6PLzNTSR67vx8dis3bt0VITMsnT
OpKG4ve0HkEuIEV4YW1wbGUgPGFsaWNlQGV4YW1wbGUuY29tPoiQBBMWCAA4FiEE
NotuHB2xL1tD4nm4dQHVa14NkU8FAmrWPkECGwEFCwkIBwIGFQoJCAsCBBYCAwEC
HgECF4AACgkQdQHVa14NkU8xAAD/asHIoVRE/nZOt6u8XCX1VTPKdttH06X4iqat
mxR3Ns8A/2KT/ls1No5xvxq3EL9WO3/Lwtl0XHJRlkjj2sEaKY8NtBlBbGljZSA8
YWxpY2VAZXhhbXBsZS5jb20+iHgEMBYIACAWIQQ2i24cHbEvW0Piebh1AdVrXg2R
TwUCatY+QwIdIAAKCRB1AdVrXg2RTzLgAQCj2zSYUh7LQCkC6TOLWRbsa6/yJcA8
HKzCc95PNvtVZQD+J3DTCrrX0z6tUuCUD0Ut2eGkxgJ5A8TWxT1+iViqwguIkAQT
FggAOBYhBDaLbhwdsS9bQ+J5uHUB1WteDZFPBQJq1j5CAhsBBQsJCAcCBhUKCQgL
AgQWAgMBAh4BAheAAAoJEHUB1WteDZFPBRcBAPBDtB3Gd9ClxQIjFN8DsiuQU4KA
xZk7WHD13jEZVqrLAQDS2uVjlsz/YwGEoT6hfEV0h2d3rm5a1d/UqEaYfv+mDrg4
BGrWPkESCisGAQQBl1UBBQEBB0D8FNh1b5fVSc7PpwgyLTWPAHBzhz6jPEIH+cX+
HjSWawMBCAeIeAQYFggAIBYhBDaLbhwdsS9bQ+J5uHUB1WteDZFPBQJq1j5BAhsM
AAoJEHUB1WteDZFPOawA/3VswbuYU0I1Me5UGGmpBF01vr47HhX6roZV6rg4uYHd
APwMrBGtly6hSYGd63ZsOI2GioeUPBef+JJY8TdzoRQeBg==
=5KoD
-----END PGP PUBLIC KEY BLOCK-----
)";

constexpr const char* kFixtureFingerprint = "0215337324269432FC6E295434AE2CD0E4BFAA06";
constexpr const char* kFixtureEncryptionSubkey = "228D77905608768FF74E27AFAAF19EECF900D666";
constexpr const char* kFixtureSigningSubkey = "4374C02FFD844F0752ED15A494753BA22335A029";

}
}
